/**
 * Unit tests for request execution
 *
 * A scripted transport stands in for libcurl so resolution, header partitioning, response
 * capture, chaining and failure classification can be checked without a network.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

#include "src/courier/executor/request_executor.hpp"
#include "src/document/parser/http_file_parser.hpp"

using courier::ExecutionConfig;
using courier::ExecutionResult;
using courier::RequestExecutor;
using document::model::RequestDefinition;
using document::model::VariableMap;
using http::error::ErrorKind;
using http::error::HttpError;

namespace {
    using Handler = std::function<http::model::Response(const http::model::Request&, std::stop_token)>;

    // Shared between the test and every client the factory hands out.
    struct ScriptedTransport {
        std::mutex mutex_;
        Handler handler_;
        std::vector<http::model::Request> sent_;
        std::vector<http::client::ClientOptions> options_seen_;
    };

    class ScriptedClient : public http::client::IHttpClient {
       public:
        explicit ScriptedClient(std::shared_ptr<ScriptedTransport> transport) : transport_(std::move(transport)) {}

        http::model::Response send(const http::model::Request& req, std::stop_token stop) override {
            Handler handler;
            {
                std::lock_guard<std::mutex> lock(transport_->mutex_);
                transport_->sent_.push_back(req);
                handler = transport_->handler_;
            }
            return handler(req, std::move(stop));
        }

       private:
        std::shared_ptr<ScriptedTransport> transport_;
    };

    http::model::Response ok_response(std::string body, std::string content_type = "application/json") {
        http::model::Response response;
        response.status_ = 200;
        response.reason_phrase_ = "OK";
        response.http_version_ = "HTTP/1.1";
        response.content_type_ = content_type;
        response.headers_.append("Content-Type", content_type);
        response.body_ = std::move(body);
        return response;
    }

    bool contains(const std::vector<std::string>& lines, const std::string& line) { return std::find(lines.begin(), lines.end(), line) != lines.end(); }
}  // namespace

class RequestExecutorTest : public ::testing::Test {
   protected:
    void SetUp() override {
        transport_ = std::make_shared<ScriptedTransport>();
        transport_->handler_ = [](const http::model::Request&, std::stop_token) { return ok_response("{}"); };

        resolver_ = std::make_shared<variables::VariableResolver>();
        resolver_->load_environment_json(R"({"dev": {"host": "https://api.test"}})");
        session_ = std::make_shared<session::ChainSession>();

        config_.timeout_ = std::chrono::milliseconds{1500};
        config_.worker_threads_ = 2;

        executor_ = make_executor();
    }

    std::unique_ptr<RequestExecutor> make_executor() {
        auto transport = transport_;
        return courier::RequestExecutorBuilder()
            .with_resolver(resolver_)
            .with_session(session_)
            .with_http_client_factory([transport](const http::client::ClientOptions& options) {
                {
                    std::lock_guard<std::mutex> lock(transport->mutex_);
                    transport->options_seen_.push_back(options);
                }
                return std::make_unique<ScriptedClient>(transport);
            })
            .with_config(config_)
            .validate()
            .build();
    }

    static RequestDefinition parse_one(const std::string& text) {
        auto parsed = document::parser::HttpFileParser().parse(text);
        EXPECT_EQ(parsed.requests_.size(), 1U);
        return parsed.requests_.front();
    }

    const http::model::Request& last_sent() const { return transport_->sent_.back(); }

    std::shared_ptr<ScriptedTransport> transport_;
    std::shared_ptr<variables::VariableResolver> resolver_;
    std::shared_ptr<session::ChainSession> session_;
    ExecutionConfig config_;
    std::unique_ptr<RequestExecutor> executor_;
};

// ============================================================================
// Request construction
// ============================================================================

TEST_F(RequestExecutorTest, ResolvesEveryFieldBeforeSending) {
    session::StoredResponse login;
    login.status_code_ = 200;
    login.body_ = R"({"token":"t1"})";
    session_->store_response("login", login);

    const RequestDefinition request = parse_one(
        "POST {{host}}/items\n"
        "Authorization: Bearer {{login.response.body.token}}\n"
        "\n"
        "{\"name\":\"{{name}}\"}\n");
    const VariableMap file{{"name", "widget"}};

    const ExecutionResult result = executor_->execute(request, file);

    ASSERT_TRUE(result.success_);
    ASSERT_EQ(transport_->sent_.size(), 1U);
    EXPECT_EQ(last_sent().method_, "POST");
    EXPECT_EQ(last_sent().url_, "https://api.test/items");
    EXPECT_TRUE(contains(last_sent().headers_, "Authorization: Bearer t1"));
    EXPECT_EQ(last_sent().body_, "{\"name\":\"widget\"}");

    EXPECT_EQ(result.request_url_, "https://api.test/items");
    EXPECT_EQ(result.request_headers_.get("authorization"), "Bearer t1");
    EXPECT_EQ(result.request_body_, "{\"name\":\"widget\"}");
}

TEST_F(RequestExecutorTest, ChainOutputIsNotReadAsTemplate) {
    session::StoredResponse stored;
    stored.body_ = R"({"literal":"{{host}}"})";
    session_->store_response("src", stored);

    const ExecutionResult result = executor_->execute(parse_one("GET https://x.test/?q={{src.response.body.literal}}"), {});

    ASSERT_TRUE(result.success_);
    EXPECT_EQ(last_sent().url_, "https://x.test/?q={{host}}");
}

TEST_F(RequestExecutorTest, BodyWithoutContentTypeGetsDefault) {
    static_cast<void>(executor_->execute(parse_one("POST https://x.test\n\nhello\n"), {}));

    EXPECT_TRUE(contains(last_sent().content_headers_, "Content-Type: text/plain; charset=utf-8"));
}

TEST_F(RequestExecutorTest, ContentHeadersTravelWithBody) {
    static_cast<void>(executor_->execute(parse_one(
                                             "PUT https://x.test\n"
                                             "Content-Type: application/json\n"
                                             "Content-Length: 999\n"
                                             "Content-Language: en\n"
                                             "Accept: */*\n"
                                             "\n"
                                             "{}\n"),
                                         {}));

    const auto& sent = last_sent();
    EXPECT_TRUE(contains(sent.content_headers_, "Content-Type: application/json"));
    EXPECT_TRUE(contains(sent.content_headers_, "Content-Language: en"));
    EXPECT_EQ(sent.content_headers_.size(), 2U);
    EXPECT_TRUE(contains(sent.headers_, "Accept: */*"));
    EXPECT_EQ(sent.headers_.size(), 1U);
}

TEST_F(RequestExecutorTest, ContentHeadersWithoutBodyAreDropped) {
    const ExecutionResult result = executor_->execute(parse_one(
                                                          "GET https://x.test\n"
                                                          "Content-Type: application/json\n"
                                                          "X-Request-Id: 1\n"),
                                                      {});

    EXPECT_TRUE(last_sent().content_headers_.empty());
    EXPECT_FALSE(last_sent().body_.has_value());
    EXPECT_FALSE(result.request_headers_.has("Content-Type"));
    EXPECT_TRUE(result.request_headers_.has("X-Request-Id"));
}

TEST_F(RequestExecutorTest, HeadSendsNoPayload) {
    const ExecutionResult result = executor_->execute(parse_one(
                                                          "HEAD https://x.test/file\n"
                                                          "Content-Type: application/json\n"
                                                          "Accept: */*\n"
                                                          "\n"
                                                          "{\"ignored\":true}\n"),
                                                      {});

    ASSERT_TRUE(result.success_);
    EXPECT_FALSE(last_sent().body_.has_value());
    EXPECT_TRUE(last_sent().content_headers_.empty());
    EXPECT_FALSE(result.request_body_.has_value());
    EXPECT_FALSE(result.request_headers_.has("Content-Type"));
    EXPECT_EQ(result.request_headers_.get("Accept"), "*/*");
}

TEST_F(RequestExecutorTest, EmptyHeaderValueIsStillSent) {
    const ExecutionResult result = executor_->execute(parse_one(
                                                          "GET https://x.test\n"
                                                          "X-Empty: {{nothing}}\n"
                                                          "X-Full: 1\n"),
                                                      {{"nothing", ""}});

    EXPECT_TRUE(contains(last_sent().headers_, "X-Empty;"));
    EXPECT_TRUE(contains(last_sent().headers_, "X-Full: 1"));
    EXPECT_EQ(result.request_headers_.get("X-Empty"), "");
}

TEST_F(RequestExecutorTest, FactoryReceivesConfiguredOptions) {
    static_cast<void>(executor_->execute(parse_one("GET https://x.test"), {}));

    ASSERT_EQ(transport_->options_seen_.size(), 1U);
    EXPECT_EQ(transport_->options_seen_[0].timeout_, std::chrono::milliseconds{1500});
    EXPECT_TRUE(transport_->options_seen_[0].follow_redirects_);
    EXPECT_EQ(transport_->options_seen_[0].max_redirects_, 10);
}

// ============================================================================
// Response capture
// ============================================================================

TEST_F(RequestExecutorTest, CapturesResponseDetails) {
    transport_->handler_ = [](const http::model::Request&, std::stop_token) {
        http::model::Response response = ok_response("caf\xE9", "text/plain; charset=ISO-8859-1");
        response.status_ = 201;
        response.reason_phrase_ = "Created";
        response.headers_.append("Set-Cookie", "sid=1; Path=/; HttpOnly");
        response.headers_.append("Set-Cookie", "theme=dark");
        response.headers_.append("Set-Cookie", "broken");
        response.headers_.append("Vary", "Accept");
        response.headers_.append("vary", "Origin");
        return response;
    };

    const ExecutionResult result = executor_->execute(parse_one("GET https://x.test"), {});

    ASSERT_TRUE(result.success_);
    EXPECT_FALSE(result.error_kind_.has_value());
    EXPECT_EQ(result.status_code_, 201);
    EXPECT_EQ(result.status_description_, "Created");
    EXPECT_EQ(result.response_headers_.get("Vary"), "Accept, Origin");
    EXPECT_EQ(result.response_headers_.get("Set-Cookie"), "sid=1; Path=/; HttpOnly, theme=dark, broken");

    ASSERT_EQ(result.cookies_.size(), 2U);
    EXPECT_EQ(result.cookies_[0].name_, "sid");
    EXPECT_TRUE(result.cookies_[0].http_only_);
    EXPECT_EQ(result.cookies_[1].value_, "dark");
    EXPECT_TRUE(result.has_cookies());

    EXPECT_EQ(result.response_size_bytes_, 4U);
    EXPECT_EQ(result.response_body_bytes_.back(), 0xE9);
    EXPECT_EQ(result.response_body_, "caf\xC3\xA9");
    EXPECT_EQ(result.content_type_, "text/plain; charset=ISO-8859-1");
    EXPECT_NE(result.executed_at_, std::chrono::system_clock::time_point{});
}

TEST_F(RequestExecutorTest, CapturesRedirectOutcome) {
    transport_->handler_ = [](const http::model::Request&, std::stop_token) {
        http::model::Response response = ok_response("{}");
        response.redirect_count_ = 2;
        response.effective_url_ = "https://x.test/final";
        return response;
    };

    const ExecutionResult result = executor_->execute(parse_one("GET https://x.test/start"), {});

    EXPECT_EQ(result.redirect_count_, 2);
    EXPECT_EQ(result.final_url_, "https://x.test/final");
    EXPECT_EQ(result.request_url_, "https://x.test/start");
}

TEST_F(RequestExecutorTest, NamedResponsesAreStoredForChaining) {
    transport_->handler_ = [](const http::model::Request&, std::stop_token) {
        http::model::Response response = ok_response(R"({"id":42})");
        response.headers_.append("X-Trace", "abc123");
        return response;
    };

    static_cast<void>(executor_->execute(parse_one("# @name create\nPOST https://x.test\n"), {}));

    EXPECT_EQ(session_->resolve_chain_references("{{create.response.body.id}}"), "42");
    EXPECT_EQ(session_->resolve_chain_references("{{create.response.headers.x-trace}}"), "abc123");
    EXPECT_TRUE(session_->has_structured_body("create"));
}

TEST_F(RequestExecutorTest, UnnamedResponsesAreNotStored) {
    static_cast<void>(executor_->execute(parse_one("GET https://x.test"), {}));
    EXPECT_TRUE(session_->stored_request_names().empty());
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(RequestExecutorTest, TimeoutIsReported) {
    transport_->handler_ = [](const http::model::Request& req, std::stop_token) -> http::model::Response {
        throw HttpError(ErrorKind::TIMEOUT, 28, req.url_, "Operation timed out");
    };

    const ExecutionResult result = executor_->execute(parse_one("# @name slow\nGET https://x.test"), {});

    EXPECT_FALSE(result.success_);
    EXPECT_EQ(result.error_kind_, ErrorKind::TIMEOUT);
    EXPECT_EQ(result.error_message_, "Request timed out after 1.5s.");
    EXPECT_TRUE(session_->stored_request_names().empty());
}

TEST_F(RequestExecutorTest, ConnectTimeoutReportsConnectLimit) {
    config_.connect_timeout_ = std::chrono::milliseconds{500};
    executor_ = make_executor();
    transport_->handler_ = [](const http::model::Request& req, std::stop_token) -> http::model::Response {
        throw HttpError(ErrorKind::TIMEOUT, 28, req.url_, "Connection timed out", true);
    };

    const ExecutionResult result = executor_->execute(parse_one("GET http://10.255.255.1/"), {});

    EXPECT_FALSE(result.success_);
    EXPECT_EQ(result.error_kind_, ErrorKind::TIMEOUT);
    EXPECT_EQ(result.error_message_, "Request timed out after 0.5s.");
}

TEST_F(RequestExecutorTest, TransferTimeoutReportsOverallLimit) {
    config_.connect_timeout_ = std::chrono::milliseconds{500};
    executor_ = make_executor();
    transport_->handler_ = [](const http::model::Request& req, std::stop_token) -> http::model::Response {
        throw HttpError(ErrorKind::TIMEOUT, 28, req.url_, "Operation timed out", false);
    };

    const ExecutionResult result = executor_->execute(parse_one("GET https://x.test/slow"), {});

    EXPECT_EQ(result.error_kind_, ErrorKind::TIMEOUT);
    EXPECT_EQ(result.error_message_, "Request timed out after 1.5s.");
}

TEST_F(RequestExecutorTest, ConnectLimitNeverExceedsOverallLimit) {
    config_.connect_timeout_ = std::chrono::milliseconds{10000};
    executor_ = make_executor();
    transport_->handler_ = [](const http::model::Request& req, std::stop_token) -> http::model::Response {
        throw HttpError(ErrorKind::TIMEOUT, 28, req.url_, "Connection timed out", true);
    };

    const ExecutionResult result = executor_->execute(parse_one("GET http://10.255.255.1/"), {});

    EXPECT_EQ(result.error_message_, "Request timed out after 1.5s.");
}

TEST_F(RequestExecutorTest, TransportFailureIsReported) {
    transport_->handler_ = [](const http::model::Request& req, std::stop_token) -> http::model::Response {
        throw HttpError(ErrorKind::TRANSPORT, 7, req.url_, "Could not connect to server");
    };

    const ExecutionResult result = executor_->execute(parse_one("GET https://x.test"), {});

    EXPECT_FALSE(result.success_);
    EXPECT_EQ(result.error_kind_, ErrorKind::TRANSPORT);
    EXPECT_EQ(result.error_message_, "HTTP error: Could not connect to server");
    EXPECT_EQ(result.request_url_, "https://x.test");
}

TEST_F(RequestExecutorTest, UnexpectedExceptionIsReported) {
    transport_->handler_ = [](const http::model::Request&, std::stop_token) -> http::model::Response { throw std::runtime_error("boom"); };

    const ExecutionResult result = executor_->execute(parse_one("GET https://x.test"), {});

    EXPECT_FALSE(result.success_);
    EXPECT_EQ(result.error_kind_, ErrorKind::UNEXPECTED);
    EXPECT_EQ(result.error_message_, "Error: boom");
}

TEST_F(RequestExecutorTest, FactoryWithoutClientIsUnexpected) {
    auto executor = courier::RequestExecutorBuilder()
                        .with_resolver(resolver_)
                        .with_session(session_)
                        .with_http_client_factory([](const http::client::ClientOptions&) { return std::unique_ptr<http::client::IHttpClient>(); })
                        .validate()
                        .build();

    const ExecutionResult result = executor->execute(parse_one("GET https://x.test"), {});

    EXPECT_FALSE(result.success_);
    EXPECT_EQ(result.error_kind_, ErrorKind::UNEXPECTED);
}

TEST(DescribeFailureTest, MessagesPerKind) {
    const std::chrono::milliseconds timeout{30000};
    EXPECT_EQ(courier::describe_failure(ErrorKind::CANCELLED, "x", timeout), "Request was cancelled.");
    EXPECT_EQ(courier::describe_failure(ErrorKind::TIMEOUT, "x", timeout), "Request timed out after 30s.");
    EXPECT_EQ(courier::describe_failure(ErrorKind::TRANSPORT, "refused", timeout), "HTTP error: refused");
    EXPECT_EQ(courier::describe_failure(ErrorKind::UNEXPECTED, "bad", timeout), "Error: bad");
}

// ============================================================================
// Asynchronous execution and cancellation
// ============================================================================

TEST_F(RequestExecutorTest, ExecuteAsyncDeliversResult) {
    auto future = executor_->execute_async(parse_one("GET {{host}}/async"), {});
    const ExecutionResult result = future.get();

    ASSERT_TRUE(result.success_);
    EXPECT_EQ(result.request_url_, "https://api.test/async");
}

TEST_F(RequestExecutorTest, ExecuteAsyncRunsConcurrently) {
    std::vector<std::future<ExecutionResult>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(executor_->execute_async(parse_one("GET https://x.test/" + std::to_string(i)), {}));
    }

    for (auto& future : futures) {
        EXPECT_TRUE(future.get().success_);
    }
    EXPECT_EQ(transport_->sent_.size(), 8U);
}

TEST_F(RequestExecutorTest, StopRequestIsReportedAsCancelled) {
    transport_->handler_ = [](const http::model::Request& req, std::stop_token stop) -> http::model::Response {
        if (stop.stop_requested()) {
            throw HttpError(ErrorKind::CANCELLED, 42, req.url_, "Callback aborted");
        }
        return ok_response("{}");
    };

    std::stop_source source;
    source.request_stop();

    const ExecutionResult result = executor_->execute_async(parse_one("GET https://x.test"), {}, source.get_token()).get();

    EXPECT_FALSE(result.success_);
    EXPECT_EQ(result.error_kind_, ErrorKind::CANCELLED);
    EXPECT_EQ(result.error_message_, "Request was cancelled.");
}

// ============================================================================
// Builder
// ============================================================================

TEST(RequestExecutorBuilderTest, ValidateRequiresCollaborators) {
    EXPECT_THROW(courier::RequestExecutorBuilder().validate(), std::runtime_error);

    EXPECT_THROW(courier::RequestExecutorBuilder()
                     .with_resolver(std::make_shared<variables::VariableResolver>())
                     .with_session(std::make_shared<session::ChainSession>())
                     .validate(),
                 std::runtime_error);

    ExecutionConfig no_workers;
    no_workers.worker_threads_ = 0;
    EXPECT_THROW(courier::RequestExecutorBuilder()
                     .with_resolver(std::make_shared<variables::VariableResolver>())
                     .with_session(std::make_shared<session::ChainSession>())
                     .with_http_client_factory([](const http::client::ClientOptions&) { return std::unique_ptr<http::client::IHttpClient>(); })
                     .with_config(no_workers)
                     .validate(),
                 std::runtime_error);
}
