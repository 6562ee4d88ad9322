#ifndef COURIER_STRING_UTILS_HPP
#define COURIER_STRING_UTILS_HPP

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    bool iequals(std::string_view a, std::string_view b);

    bool istarts_with(std::string_view s, std::string_view prefix);

    std::string to_lower(std::string_view s);

    std::string to_upper(std::string_view s);

    std::string trim(std::string s);

    std::string_view trim_view(std::string_view sv);

    bool is_blank(std::string_view sv);

    std::vector<std::string> split_lines(std::string_view text);

    std::vector<std::string> split(std::string_view sv, char delimiter);

    std::string join(const std::vector<std::string>& parts, std::string_view separator);

    std::optional<long long> parse_integer(std::string_view sv);

    // Returns nullopt to signal "not a placeholder here", in which case scanning resumes one
    // character later. Any returned string replaces the whole {{...}} match.
    using PlaceholderEvaluator = std::function<std::optional<std::string>(std::string_view inner, std::string_view whole)>;

    // Single left-to-right pass over `{{inner}}` tokens where inner is one or more characters
    // other than '}'. Replacement text is never re-scanned.
    std::string replace_placeholders(std::string_view input, const PlaceholderEvaluator& evaluate);

    struct CaseInsensitiveLess {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const;
    };
}  // namespace string_utils

#endif
