#ifndef COURIER_HTTP_MODEL_HPP
#define COURIER_HTTP_MODEL_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "header_map.hpp"

namespace http::model {
    struct Request {
        std::string url_;
        std::string method_ = "GET";
        std::optional<std::string> body_;

        // "Name: value" lines; content headers only go out together with a body
        std::vector<std::string> headers_;
        std::vector<std::string> content_headers_;
    };

    // Best-effort phase breakdown; phases the transport cannot measure stay zero.
    struct Timing {
        std::chrono::microseconds dns_resolution_{0};
        std::chrono::microseconds connection_{0};
        std::chrono::microseconds tls_handshake_{0};
        std::chrono::microseconds time_to_first_byte_{0};
        std::chrono::microseconds content_download_{0};
        std::chrono::microseconds total_{0};
    };

    struct Response {
        long status_ = 0;
        long redirect_count_ = 0;

        std::string http_version_;
        std::string reason_phrase_;
        std::string effective_url_;
        std::string content_type_;

        // Headers of the final response only, repeated fields kept as separate entries
        HeaderMap headers_;
        std::string body_;

        Timing timing_;
    };
}  // namespace http::model

#endif
