#include "execution_result.hpp"

#include <array>
#include <cstdio>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

using namespace std::chrono;

namespace courier {
    namespace {
        const size_t FORMAT_BUFFER_SIZE = 32;

        bool content_type_contains(const std::string& content_type, std::string_view needle) {
            return string_utils::to_lower(content_type).find(needle) != std::string::npos;
        }
    }  // namespace

    std::string format_size(size_t bytes) {
        std::array<char, FORMAT_BUFFER_SIZE> buffer{};

        if (bytes < static_cast<size_t>(constants::BYTES_PER_KB)) {
            return std::to_string(bytes) + " B";
        }
        if (bytes < static_cast<size_t>(constants::BYTES_PER_MB)) {
            std::snprintf(buffer.data(), buffer.size(), "%.1f KB", static_cast<double>(bytes) / constants::BYTES_PER_KB);
            return buffer.data();
        }
        std::snprintf(buffer.data(), buffer.size(), "%.1f MB", static_cast<double>(bytes) / constants::BYTES_PER_MB);
        return buffer.data();
    }

    std::string format_duration(microseconds elapsed) {
        const auto ms = duration_cast<milliseconds>(elapsed).count();
        if (ms < constants::ONE_SECOND_MS) {
            return std::to_string(ms) + " ms";
        }

        std::array<char, FORMAT_BUFFER_SIZE> buffer{};
        std::snprintf(buffer.data(), buffer.size(), "%.2f s", static_cast<double>(ms) / constants::ONE_SECOND_MS);
        return buffer.data();
    }

    std::string ExecutionResult::formatted_size() const { return format_size(response_size_bytes_); }

    std::string ExecutionResult::formatted_time() const { return format_duration(timing_.total_); }

    bool ExecutionResult::is_success_status_code() const {
        return status_code_ >= constants::HTTP_SUCCESS_LOWER_BOUNDARY && status_code_ < constants::HTTP_SUCCESS_UPPER_BOUNDARY;
    }

    bool ExecutionResult::is_json() const { return content_type_contains(content_type_, "json"); }

    bool ExecutionResult::is_xml() const { return content_type_contains(content_type_, "xml"); }

    bool ExecutionResult::is_html() const { return content_type_contains(content_type_, "html"); }
}  // namespace courier
