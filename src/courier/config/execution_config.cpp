#include "execution_config.hpp"

#include <cstdlib>
#include <optional>

#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"

namespace courier {
    namespace {
        std::optional<long long> read_positive(const char* key) {
            const char* raw = std::getenv(key);
            if (raw == nullptr) {
                return std::nullopt;
            }

            const auto parsed = string_utils::parse_integer(raw);
            if (!parsed || *parsed <= 0) {
                logging::get_logger()->warn("Ignoring {}={}: expected a positive integer", key, raw);
                return std::nullopt;
            }
            return parsed;
        }
    }  // namespace

    http::client::ClientOptions ExecutionConfig::to_client_options() const {
        return http::client::ClientOptions{.timeout_ = timeout_,
                                           .connect_timeout_ = connect_timeout_,
                                           .follow_redirects_ = follow_redirects_,
                                           .max_redirects_ = max_redirects_,
                                           .auto_decompress_ = auto_decompress_,
                                           .user_agent_ = user_agent_};
    }

    ExecutionConfig apply_environment_overrides(ExecutionConfig base) {
        if (auto v = read_positive(EnvironmentKeys::TIMEOUT_MS)) {
            base.timeout_ = std::chrono::milliseconds{*v};
        }
        if (auto v = read_positive(EnvironmentKeys::MAX_REDIRECTS)) {
            base.max_redirects_ = static_cast<long>(*v);
        }
        if (auto v = read_positive(EnvironmentKeys::WORKER_THREADS)) {
            base.worker_threads_ = static_cast<size_t>(*v);
        }
        if (const char* agent = std::getenv(EnvironmentKeys::USER_AGENT); agent != nullptr && !string_utils::is_blank(agent)) {
            base.user_agent_ = agent;
        }
        return base;
    }
}  // namespace courier
