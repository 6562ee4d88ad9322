#ifndef COURIER_EXECUTION_RESULT_HPP
#define COURIER_EXECUTION_RESULT_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../../http/cookies/cookie_parser.hpp"
#include "../../http/error/http_error.hpp"
#include "../../http/model/header_map.hpp"
#include "../../http/model/model.hpp"

namespace courier {
    struct ExecutionResult {
        bool success_ = false;
        std::optional<http::error::ErrorKind> error_kind_;
        std::string error_message_;

        // What was actually sent, after resolution
        std::string request_method_;
        std::string request_url_;
        http::model::HeaderMap request_headers_;
        std::optional<std::string> request_body_;

        long status_code_ = 0;
        std::string status_description_;
        std::string http_version_;
        long redirect_count_ = 0;
        std::string final_url_;  // where the redirects ended up
        http::model::HeaderMap response_headers_;
        std::vector<http::cookies::Cookie> cookies_;
        std::string response_body_;
        std::vector<std::uint8_t> response_body_bytes_;
        size_t response_size_bytes_ = 0;
        std::string content_type_;

        // total_ is wall clock measured by the executor; the phases come from the transport
        http::model::Timing timing_;
        std::chrono::system_clock::time_point executed_at_{};

        [[nodiscard]] std::string formatted_size() const;
        [[nodiscard]] std::string formatted_time() const;
        [[nodiscard]] bool is_success_status_code() const;
        [[nodiscard]] bool is_json() const;
        [[nodiscard]] bool is_xml() const;
        [[nodiscard]] bool is_html() const;
        [[nodiscard]] bool has_cookies() const { return !cookies_.empty(); }
    };

    std::string format_size(size_t bytes);
    std::string format_duration(std::chrono::microseconds elapsed);
}  // namespace courier

#endif
