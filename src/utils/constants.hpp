#ifndef COURIER_CONSTANTS_HPP
#define COURIER_CONSTANTS_HPP

#include <array>
#include <string_view>

namespace constants {
    inline constexpr long ONE_SECOND_MS = 1000L;
    inline constexpr long BYTES_PER_KB = 1024L;
    inline constexpr long BYTES_PER_MB = 1024L * 1024L;
    inline constexpr int HTTP_SUCCESS_LOWER_BOUNDARY = 200;
    inline constexpr int HTTP_SUCCESS_UPPER_BOUNDARY = 300;

    inline constexpr const char* DEFAULT_ENVIRONMENT = "dev";
    inline constexpr const char* SHARED_ENVIRONMENT = "$shared";
    inline constexpr const char* ENVIRONMENT_FILE_NAME = "http-client.env.json";
    inline constexpr const char* DEFAULT_BODY_CONTENT_TYPE = "text/plain; charset=utf-8";
    inline constexpr const char* DEFAULT_CHARSET = "utf-8";
    inline constexpr const char* LOGGER_NAME = "courier";

    inline constexpr std::array<std::string_view, 9> HTTP_METHODS = {"GET", "POST", "PUT", "DELETE", "PATCH", "HEAD", "OPTIONS", "TRACE", "CONNECT"};

    inline constexpr std::array<std::string_view, 8> CONTENT_HEADERS = {"Content-Type",     "Content-Length", "Content-Encoding", "Content-Language",
                                                                        "Content-Location", "Content-MD5",    "Content-Range",    "Content-Disposition"};
}  // namespace constants

#endif
