#include "http_error.hpp"

#include <stdexcept>
#include <string>

namespace http::error {
    std::string_view to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::CANCELLED:
                return "cancelled";
            case ErrorKind::TIMEOUT:
                return "timeout";
            case ErrorKind::TRANSPORT:
                return "transport";
            case ErrorKind::UNEXPECTED:
                return "unexpected";
        }
        return "unexpected";
    }

    HttpError::HttpError(ErrorKind kind, long transport_code,
                         std::string u,           // NOLINT(bugprone-easily-swappable-parameters)
                         const std::string &msg,  // NOLINT(bugprone-easily-swappable-parameters)
                         bool during_connect)
        : std::runtime_error(msg), kind_(kind), transport_code_(transport_code), url_(std::move(u)), during_connect_(during_connect) {}
};  // namespace http::error
