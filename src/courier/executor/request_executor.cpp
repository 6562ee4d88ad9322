#include "request_executor.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdio>
#include <stdexcept>

#include "../../http/cookies/cookie_parser.hpp"
#include "../../http/encoding/charset.hpp"
#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"

using namespace std::chrono;

namespace courier {
    namespace {
        const size_t MESSAGE_BUFFER_SIZE = 64;

        struct HeaderNames {
            static constexpr const char* CONTENT_TYPE = "Content-Type";
            static constexpr const char* CONTENT_LENGTH = "Content-Length";
            static constexpr const char* SET_COOKIE = "Set-Cookie";
        };

        const char* const HEAD_METHOD = "HEAD";

        bool is_content_header(std::string_view name) {
            return std::any_of(constants::CONTENT_HEADERS.begin(), constants::CONTENT_HEADERS.end(),
                               [name](std::string_view h) { return string_utils::iequals(h, name); });
        }

        // libcurl drops "Name:" with nothing after it; "Name;" is how an empty value goes out
        std::string header_line(std::string_view name, std::string_view value) {
            std::string line(name);
            if (value.empty()) {
                line.push_back(';');
                return line;
            }
            line.append(": ");
            line.append(value);
            return line;
        }
    }  // namespace

    std::string describe_failure(http::error::ErrorKind kind, std::string_view detail, milliseconds timeout) {
        switch (kind) {
            case http::error::ErrorKind::CANCELLED:
                return "Request was cancelled.";
            case http::error::ErrorKind::TIMEOUT: {
                std::array<char, MESSAGE_BUFFER_SIZE> buffer{};
                std::snprintf(buffer.data(), buffer.size(), "Request timed out after %gs.", static_cast<double>(timeout.count()) / constants::ONE_SECOND_MS);
                return buffer.data();
            }
            case http::error::ErrorKind::TRANSPORT:
                return "HTTP error: " + std::string(detail);
            case http::error::ErrorKind::UNEXPECTED:
                break;
        }
        return "Error: " + std::string(detail);
    }

    //
    // RequestExecutorBuilder implementation
    //

    RequestExecutorBuilder& RequestExecutorBuilder::with_resolver(std::shared_ptr<variables::VariableResolver> resolver) {
        resolver_ = std::move(resolver);
        return *this;
    }

    RequestExecutorBuilder& RequestExecutorBuilder::with_session(std::shared_ptr<session::ChainSession> session) {
        session_ = std::move(session);
        return *this;
    }

    RequestExecutorBuilder& RequestExecutorBuilder::with_http_client_factory(HttpClientFactory http_client_factory) {
        http_client_factory_ = std::move(http_client_factory);
        return *this;
    }

    RequestExecutorBuilder& RequestExecutorBuilder::with_config(const ExecutionConfig& config) {
        config_ = config;
        return *this;
    }

    RequestExecutorBuilder& RequestExecutorBuilder::validate() {
        if (resolver_ == nullptr) {
            throw std::runtime_error("Variable resolver is required");
        }
        if (session_ == nullptr) {
            throw std::runtime_error("Chain session is required");
        }
        if (http_client_factory_ == nullptr) {
            throw std::runtime_error("HTTP client factory is required");
        }
        if (config_.worker_threads_ == 0) {
            throw std::runtime_error("Worker threads are required");
        }
        return *this;
    }

    std::unique_ptr<RequestExecutor> RequestExecutorBuilder::build() {
        return std::make_unique<RequestExecutor>(std::move(resolver_), std::move(session_), std::move(http_client_factory_), config_);
    }

    //
    // RequestExecutor implementation
    //

    RequestExecutor::RequestExecutor(std::shared_ptr<variables::VariableResolver> resolver, std::shared_ptr<session::ChainSession> session,
                                     HttpClientFactory http_client_factory, ExecutionConfig config)
        : resolver_(std::move(resolver)),
          session_(std::move(session)),
          http_client_factory_(std::move(http_client_factory)),
          config_(std::move(config)),
          pool_(std::make_unique<concurrency::ThreadPool>(config_.worker_threads_)) {}

    std::future<ExecutionResult> RequestExecutor::execute_async(document::model::RequestDefinition request, document::model::VariableMap file_variables,
                                                                std::stop_token stop) {
        return pool_->submit([this, request = std::move(request), file_variables = std::move(file_variables), stop = std::move(stop)]() {
            return execute(request, file_variables, stop);
        });
    }

    ExecutionResult RequestExecutor::execute(const document::model::RequestDefinition& request, const document::model::VariableMap& file_variables,
                                             std::stop_token stop) const {
        ExecutionResult result;
        result.executed_at_ = system_clock::now();
        result.request_method_ = request.method_;

        const auto started = steady_clock::now();
        try {
            const http::model::Request wire_request = build_request(request, file_variables, result);

            std::unique_ptr<http::client::IHttpClient> client = http_client_factory_(config_.to_client_options());
            if (client == nullptr) {
                throw std::runtime_error("HTTP client factory returned no client");
            }

            http::model::Response response = client->send(wire_request, std::move(stop));
            const auto elapsed = duration_cast<microseconds>(steady_clock::now() - started);

            capture_response(request, std::move(response), result);
            result.timing_.total_ = elapsed;

            logging::get_logger()->info("{} {} -> {} {} ({}, {})", result.request_method_, result.request_url_, result.status_code_, result.status_description_,
                                        result.formatted_size(), result.formatted_time());
        } catch (const http::error::HttpError& e) {
            result.timing_.total_ = duration_cast<microseconds>(steady_clock::now() - started);
            capture_failure(e.kind_, e.what(), e.during_connect_ ? config_.effective_connect_timeout() : config_.timeout_, result);
        } catch (const std::exception& e) {
            result.timing_.total_ = duration_cast<microseconds>(steady_clock::now() - started);
            capture_failure(http::error::ErrorKind::UNEXPECTED, e.what(), config_.timeout_, result);
        }

        return result;
    }

    std::string RequestExecutor::resolve_field(std::string_view text, const document::model::RequestDefinition& request,
                                               const document::model::VariableMap& file_variables) const {
        // Chain references first so their output is never read as a template
        const std::string chained = session_->resolve_chain_references(text);
        return resolver_->resolve(chained, request.local_variables_, file_variables);
    }

    http::model::Request RequestExecutor::build_request(const document::model::RequestDefinition& request, const document::model::VariableMap& file_variables,
                                                        ExecutionResult& result) const {
        http::model::Request out;
        out.method_ = request.method_;
        out.url_ = resolve_field(request.url_, request, file_variables);
        result.request_url_ = out.url_;

        // HEAD carries no payload on the wire, so none is resolved or reported
        if (request.body_ && out.method_ != HEAD_METHOD) {
            out.body_ = resolve_field(*request.body_, request, file_variables);
        }
        const bool has_body = out.body_.has_value();

        bool has_content_type = false;
        for (const auto& [name, template_value] : request.headers_) {
            const std::string value = resolve_field(template_value, request, file_variables);

            if (!is_content_header(name)) {
                out.headers_.push_back(header_line(name, value));
                result.request_headers_.append(name, value);
                continue;
            }

            // The transport computes the length; content headers travel only with a body
            if (string_utils::iequals(name, HeaderNames::CONTENT_LENGTH) || !has_body) {
                logging::get_logger()->debug("Not sending {} for {} {}", name, out.method_, out.url_);
                continue;
            }

            has_content_type = has_content_type || string_utils::iequals(name, HeaderNames::CONTENT_TYPE);
            out.content_headers_.push_back(header_line(name, value));
            result.request_headers_.append(name, value);
        }

        if (has_body && !has_content_type) {
            out.content_headers_.push_back(header_line(HeaderNames::CONTENT_TYPE, constants::DEFAULT_BODY_CONTENT_TYPE));
            result.request_headers_.append(HeaderNames::CONTENT_TYPE, constants::DEFAULT_BODY_CONTENT_TYPE);
        }

        result.request_body_ = out.body_;
        return out;
    }

    void RequestExecutor::capture_response(const document::model::RequestDefinition& request, http::model::Response response, ExecutionResult& result) const {
        result.success_ = true;
        result.status_code_ = response.status_;
        result.status_description_ = std::move(response.reason_phrase_);
        result.http_version_ = std::move(response.http_version_);
        result.redirect_count_ = response.redirect_count_;
        result.final_url_ = std::move(response.effective_url_);
        result.timing_ = response.timing_;

        for (const auto& [name, value] : response.headers_) {
            result.response_headers_.merge(name, value);
        }

        for (const auto& raw : response.headers_.get_all(HeaderNames::SET_COOKIE)) {
            if (auto cookie = http::cookies::parse_set_cookie(raw)) {
                result.cookies_.push_back(std::move(*cookie));
            }
        }

        result.content_type_ = !response.content_type_.empty() ? response.content_type_ : result.response_headers_.get(HeaderNames::CONTENT_TYPE).value_or("");
        result.response_size_bytes_ = response.body_.size();
        result.response_body_bytes_.assign(response.body_.begin(), response.body_.end());
        result.response_body_ = http::encoding::decode_body(response.body_, result.content_type_);

        if (request.name_ && !request.name_->empty()) {
            session_->store_response(*request.name_, session::StoredResponse{.status_code_ = result.status_code_,
                                                                             .headers_ = result.response_headers_,
                                                                             .body_ = result.response_body_,
                                                                             .timestamp_ = {}});
        }
    }

    void RequestExecutor::capture_failure(http::error::ErrorKind kind, std::string_view detail, milliseconds timeout, ExecutionResult& result) const {
        result.success_ = false;
        result.error_kind_ = kind;
        result.error_message_ = describe_failure(kind, detail, timeout);

        logging::get_logger()->warn("{} {} failed ({}): {}", result.request_method_, result.request_url_, http::error::to_string(kind), detail);
    }
}  // namespace courier
