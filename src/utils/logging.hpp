#ifndef COURIER_LOGGING_HPP
#define COURIER_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace logging {
    // Process-wide "courier" logger writing to stderr. Created on first use with the level taken
    // from COURIER_LOG_LEVEL (default info).
    std::shared_ptr<spdlog::logger> get_logger();

    void set_level(std::string_view level_name);
}  // namespace logging

#endif
