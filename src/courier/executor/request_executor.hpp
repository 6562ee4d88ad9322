#ifndef COURIER_REQUEST_EXECUTOR_HPP
#define COURIER_REQUEST_EXECUTOR_HPP

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

#include "../../document/model/model.hpp"
#include "../../http/client/interface.hpp"
#include "../../http/error/http_error.hpp"
#include "../../session/store/chain_session.hpp"
#include "../../utils/thread_pool.hpp"
#include "../../variables/resolver/variable_resolver.hpp"
#include "../config/execution_config.hpp"
#include "execution_result.hpp"

namespace courier {
    using HttpClientFactory = std::function<std::unique_ptr<http::client::IHttpClient>(const http::client::ClientOptions&)>;

    // User-facing failure text for each error kind.
    std::string describe_failure(http::error::ErrorKind kind, std::string_view detail, std::chrono::milliseconds timeout);

    // Resolves a request definition, sends it and captures the outcome. Never throws for
    // transport or data problems; failures come back as ExecutionResult with success_ == false.
    class RequestExecutor {
       public:
        RequestExecutor(std::shared_ptr<variables::VariableResolver> resolver, std::shared_ptr<session::ChainSession> session,
                        HttpClientFactory http_client_factory, ExecutionConfig config);

        ~RequestExecutor() = default;
        RequestExecutor(const RequestExecutor&) = delete;
        RequestExecutor& operator=(const RequestExecutor&) = delete;
        RequestExecutor(RequestExecutor&&) = delete;
        RequestExecutor& operator=(RequestExecutor&&) = delete;

        [[nodiscard]] ExecutionResult execute(const document::model::RequestDefinition& request, const document::model::VariableMap& file_variables,
                                              std::stop_token stop = {}) const;

        [[nodiscard]] std::future<ExecutionResult> execute_async(document::model::RequestDefinition request, document::model::VariableMap file_variables,
                                                                 std::stop_token stop = {});

        [[nodiscard]] const ExecutionConfig& config() const { return config_; }

       private:
        [[nodiscard]] std::string resolve_field(std::string_view text, const document::model::RequestDefinition& request,
                                                const document::model::VariableMap& file_variables) const;
        [[nodiscard]] http::model::Request build_request(const document::model::RequestDefinition& request, const document::model::VariableMap& file_variables,
                                                         ExecutionResult& result) const;
        void capture_response(const document::model::RequestDefinition& request, http::model::Response response, ExecutionResult& result) const;
        void capture_failure(http::error::ErrorKind kind, std::string_view detail, std::chrono::milliseconds timeout, ExecutionResult& result) const;

        std::shared_ptr<variables::VariableResolver> resolver_;
        std::shared_ptr<session::ChainSession> session_;
        HttpClientFactory http_client_factory_;
        ExecutionConfig config_;

        // Declared last: joined before anything its tasks touch goes away
        std::unique_ptr<concurrency::ThreadPool> pool_;
    };

    class RequestExecutorBuilder {
       public:
        RequestExecutorBuilder& with_resolver(std::shared_ptr<variables::VariableResolver> resolver);
        RequestExecutorBuilder& with_session(std::shared_ptr<session::ChainSession> session);
        RequestExecutorBuilder& with_http_client_factory(HttpClientFactory http_client_factory);
        RequestExecutorBuilder& with_config(const ExecutionConfig& config);
        RequestExecutorBuilder& validate();
        std::unique_ptr<RequestExecutor> build();

       private:
        std::shared_ptr<variables::VariableResolver> resolver_;
        std::shared_ptr<session::ChainSession> session_;
        HttpClientFactory http_client_factory_;
        ExecutionConfig config_;
    };
}  // namespace courier

#endif
