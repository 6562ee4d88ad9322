#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>

#include "constants.hpp"

namespace logging {
    namespace {
        // spdlog maps unknown names to "off"; treat those as the default level instead.
        spdlog::level::level_enum parse_level(const std::string& name) {
            const auto level = spdlog::level::from_str(name);
            if (level == spdlog::level::off && name != "off") {
                return spdlog::level::info;
            }
            return level;
        }

        std::shared_ptr<spdlog::logger> create_logger() {
            auto logger = spdlog::stderr_color_mt(constants::LOGGER_NAME);
            logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

            const char* level = std::getenv("COURIER_LOG_LEVEL");
            logger->set_level(level != nullptr ? parse_level(level) : spdlog::level::info);
            return logger;
        }
    }  // namespace

    std::shared_ptr<spdlog::logger> get_logger() {
        static std::once_flag once;
        static std::shared_ptr<spdlog::logger> logger;

        std::call_once(once, [] {
            logger = spdlog::get(constants::LOGGER_NAME);
            if (!logger) {
                logger = create_logger();
            }
        });

        return logger;
    }

    void set_level(std::string_view level_name) { get_logger()->set_level(parse_level(std::string(level_name))); }
}  // namespace logging
