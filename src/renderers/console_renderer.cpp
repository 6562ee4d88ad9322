#include "console_renderer.hpp"

#include <sstream>

#include "../courier/executor/execution_result.hpp"

namespace renderers {
    namespace {
        void write_request(std::ostringstream& out, const courier::ExecutionResult& result) {
            out << "=== REQUEST ===\n";
            out << result.request_method_ << ' ' << result.request_url_ << '\n';
            for (const auto& [name, value] : result.request_headers_) {
                out << name << ": " << value << '\n';
            }
            if (result.request_body_) {
                out << '\n' << *result.request_body_ << '\n';
            }
        }

        void write_response(std::ostringstream& out, const courier::ExecutionResult& result) {
            out << "=== RESPONSE ===\n";
            if (!result.success_) {
                out << result.error_message_ << '\n';
                out << "Time: " << result.formatted_time() << '\n';
                return;
            }

            out << (result.http_version_.empty() ? "HTTP/1.1" : result.http_version_) << ' ' << result.status_code_;
            if (!result.status_description_.empty()) {
                out << ' ' << result.status_description_;
            }
            out << '\n';

            for (const auto& [name, value] : result.response_headers_) {
                out << name << ": " << value << '\n';
            }
            if (!result.response_body_.empty()) {
                out << '\n' << result.response_body_ << '\n';
            }

            out << "\nSize: " << result.formatted_size() << "  Time: " << result.formatted_time() << '\n';
            if (result.redirect_count_ > 0) {
                out << "Redirects: " << result.redirect_count_ << "  Final URL: " << result.final_url_ << '\n';
            }

            if (result.has_cookies()) {
                out << "Cookies:\n";
                for (const auto& cookie : result.cookies_) {
                    out << "  " << cookie.name_ << '=' << cookie.value_;
                    if (!cookie.path_.empty()) {
                        out << "; Path=" << cookie.path_;
                    }
                    if (!cookie.domain_.empty()) {
                        out << "; Domain=" << cookie.domain_;
                    }
                    if (cookie.http_only_) {
                        out << "; HttpOnly";
                    }
                    if (cookie.secure_) {
                        out << "; Secure";
                    }
                    out << '\n';
                }
            }
        }
    }  // namespace

    ConsoleRenderer::ConsoleRenderer(std::ostream& out) : out_(out) {}

    void ConsoleRenderer::render(const courier::ExecutionResult& result) { out_ << format(result) << std::flush; }

    std::string ConsoleRenderer::format(const courier::ExecutionResult& result) {
        std::ostringstream out;
        write_request(out, result);
        out << '\n';
        write_response(out, result);
        out << '\n';
        return out.str();
    }
}  // namespace renderers
