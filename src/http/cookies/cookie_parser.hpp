#ifndef COURIER_COOKIE_PARSER_HPP
#define COURIER_COOKIE_PARSER_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace http::cookies {
    struct Cookie {
        std::string name_;
        std::string value_;
        std::string domain_;
        std::string path_;
        std::optional<std::chrono::system_clock::time_point> expires_;
        bool http_only_ = false;
        bool secure_ = false;
        std::string same_site_;

        // The full Set-Cookie value as received
        std::string raw_value_;
    };

    struct AttributeNames {
        static constexpr const char* DOMAIN = "Domain";
        static constexpr const char* PATH = "Path";
        static constexpr const char* EXPIRES = "Expires";
        static constexpr const char* HTTP_ONLY = "HttpOnly";
        static constexpr const char* SECURE = "Secure";
        static constexpr const char* SAME_SITE = "SameSite";
    };

    // Parses one Set-Cookie header value. Returns nullopt when the leading pair has no '='.
    // Unknown attributes are ignored; an unparseable Expires leaves expires_ empty.
    std::optional<Cookie> parse_set_cookie(std::string_view header_value);

    std::optional<std::chrono::system_clock::time_point> parse_cookie_date(std::string_view text);
}  // namespace http::cookies

#endif
