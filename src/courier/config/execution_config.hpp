#ifndef COURIER_EXECUTION_CONFIG_HPP
#define COURIER_EXECUTION_CONFIG_HPP

#include <algorithm>
#include <chrono>
#include <string>

#include "../../http/client/interface.hpp"

namespace courier {
    const size_t DEFAULT_WORKER_THREADS = 4;

    struct EnvironmentKeys {
        static constexpr const char* TIMEOUT_MS = "COURIER_TIMEOUT_MS";
        static constexpr const char* MAX_REDIRECTS = "COURIER_MAX_REDIRECTS";
        static constexpr const char* WORKER_THREADS = "COURIER_WORKER_THREADS";
        static constexpr const char* USER_AGENT = "COURIER_USER_AGENT";
    };

    struct ExecutionConfig {
        std::chrono::milliseconds timeout_{http::client::DEFAULT_TIMEOUT_MS};
        std::chrono::milliseconds connect_timeout_{http::client::DEFAULT_CONNECT_TIMEOUT_MS};
        bool follow_redirects_ = true;
        long max_redirects_ = http::client::DEFAULT_MAX_REDIRECTS;
        bool auto_decompress_ = true;
        std::string user_agent_ = "courier/1.0";
        size_t worker_threads_ = DEFAULT_WORKER_THREADS;

        [[nodiscard]] http::client::ClientOptions to_client_options() const;

        // The connect phase is never allowed to outlast the whole request
        [[nodiscard]] std::chrono::milliseconds effective_connect_timeout() const { return std::min(connect_timeout_, timeout_); }
    };

    // Applies COURIER_* overrides on top of `base`. Values that are not positive integers are
    // ignored with a warning.
    ExecutionConfig apply_environment_overrides(ExecutionConfig base);
}  // namespace courier

#endif
