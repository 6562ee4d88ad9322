#ifndef COURIER_BUILTIN_FUNCTIONS_HPP
#define COURIER_BUILTIN_FUNCTIONS_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace variables::builtins {
    inline constexpr char SIGIL = '$';

    struct FunctionNames {
        static constexpr const char* DATETIME = "$datetime";
        static constexpr const char* GUID = "$guid";
        static constexpr const char* RANDOM_INT = "$randomInt";
        static constexpr const char* TIMESTAMP = "$timestamp";
        static constexpr const char* PROCESS_ENV = "$processEnv";
        static constexpr const char* DOTENV = "$dotenv";
    };

    struct DatetimeFormats {
        static constexpr const char* ISO8601 = "iso8601";
        static constexpr const char* RFC1123 = "rfc1123";
    };

    [[nodiscard]] inline bool is_builtin(std::string_view name) { return !name.empty() && name.front() == SIGIL; }

    // `expression` is the trimmed placeholder text, e.g. "$randomInt 1,10". Returns nullopt for
    // names that carry the sigil but are not a known generator.
    [[nodiscard]] std::optional<std::string> evaluate(std::string_view expression);

    [[nodiscard]] std::string format_datetime(std::chrono::system_clock::time_point at, std::string_view format);
    [[nodiscard]] std::string generate_guid();
    [[nodiscard]] std::string random_int(std::string_view parameters);
    [[nodiscard]] std::string unix_timestamp(std::chrono::system_clock::time_point at);
    [[nodiscard]] std::string process_env(std::string_view name);
}  // namespace variables::builtins

#endif
