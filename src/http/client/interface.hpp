#ifndef COURIER_CLIENT_INTERFACE_HPP
#define COURIER_CLIENT_INTERFACE_HPP

#include <chrono>
#include <stop_token>
#include <string>

#include "../model/model.hpp"

namespace http::client {
    const long DEFAULT_TIMEOUT_MS = 30'000L;
    const long DEFAULT_CONNECT_TIMEOUT_MS = 10'000L;
    const long DEFAULT_MAX_REDIRECTS = 10L;

    struct ClientOptions {
        std::chrono::milliseconds timeout_{DEFAULT_TIMEOUT_MS};
        std::chrono::milliseconds connect_timeout_{DEFAULT_CONNECT_TIMEOUT_MS};
        bool follow_redirects_ = true;
        long max_redirects_ = DEFAULT_MAX_REDIRECTS;
        bool auto_decompress_ = true;
        std::string user_agent_ = "courier/1.0";
    };

    // Sends one request and returns the final response. Failures are thrown as
    // http::error::HttpError; a requested stop aborts the transfer with ErrorKind::CANCELLED.
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        virtual http::model::Response send(const http::model::Request& req, std::stop_token stop) = 0;
    };
}  // namespace http::client

#endif
