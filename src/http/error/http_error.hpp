#ifndef COURIER_HTTP_ERROR_HPP
#define COURIER_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace http::error {
    // Ordered from most to least specific.
    enum class ErrorKind { CANCELLED, TIMEOUT, TRANSPORT, UNEXPECTED };

    std::string_view to_string(ErrorKind kind);

    struct HttpError : public std::runtime_error {
        ErrorKind kind_;
        long transport_code_;
        std::string url_;
        // Set for a TIMEOUT that fired before the connection was ready, so the connect limit applies
        bool during_connect_;
        explicit HttpError(ErrorKind kind, long transport_code, std::string url, const std::string &msg, bool during_connect = false);
    };
}  // namespace http::error

#endif
