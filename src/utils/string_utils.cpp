#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>
#include <vector>

namespace string_utils {
    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    bool ieq_prefix(const char *buf, size_t n, const char *key) {
        for (size_t i = 0; key[i] != '\0' && i < n; ++i) {
            if (std::tolower(static_cast<unsigned char>(buf[i])) != std::tolower(static_cast<unsigned char>(key[i]))) {
                return false;
            }
            if (key[i + 1] == '\0') {
                return true;
            }
        }
        return false;
    }

    bool iequals(std::string_view a, std::string_view b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    bool istarts_with(std::string_view s, std::string_view prefix) { return s.size() >= prefix.size() && iequals(s.substr(0, prefix.size()), prefix); }

    std::string to_lower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    std::string to_upper(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return out;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::string_view trim_view(std::string_view sv) {
        while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())) != 0) {
            sv.remove_prefix(1);
        }
        while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())) != 0) {
            sv.remove_suffix(1);
        }
        return sv;
    }

    bool is_blank(std::string_view sv) {
        return std::all_of(sv.begin(), sv.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    }

    std::vector<std::string> split_lines(std::string_view text) {
        std::vector<std::string> out;
        size_t start = 0;
        for (size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '\r' || text[i] == '\n') {
                out.emplace_back(text.substr(start, i - start));
                if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                    ++i;
                }
                start = i + 1;
            }
        }
        out.emplace_back(text.substr(start));
        return out;
    }

    std::vector<std::string> split(std::string_view sv, char delimiter) {
        std::vector<std::string> out;
        size_t start = 0;
        for (;;) {
            const size_t pos = sv.find(delimiter, start);
            if (pos == std::string_view::npos) {
                out.emplace_back(sv.substr(start));
                break;
            }
            out.emplace_back(sv.substr(start, pos - start));
            start = pos + 1;
        }
        return out;
    }

    std::string join(const std::vector<std::string> &parts, std::string_view separator) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) {
                out.append(separator);
            }
            out.append(parts[i]);
        }
        return out;
    }

    std::optional<long long> parse_integer(std::string_view sv) {
        sv = trim_view(sv);
        if (!sv.empty() && sv.front() == '+') {
            sv.remove_prefix(1);
        }
        if (sv.empty()) {
            return std::nullopt;
        }

        long long value = 0;
        const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
        if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
            return std::nullopt;
        }
        return value;
    }

    std::string replace_placeholders(std::string_view input, const PlaceholderEvaluator &evaluate) {
        std::string out;
        out.reserve(input.size());

        size_t i = 0;
        while (i < input.size()) {
            if (input.compare(i, 2, "{{") != 0) {
                out.push_back(input[i]);
                ++i;
                continue;
            }

            const size_t close = input.find('}', i + 2);
            if (close == std::string_view::npos || close == i + 2 || close + 1 >= input.size() || input[close + 1] != '}') {
                out.push_back(input[i]);
                ++i;
                continue;
            }

            const std::string_view whole = input.substr(i, close + 2 - i);
            const std::string_view inner = input.substr(i + 2, close - i - 2);

            std::optional<std::string> replacement = evaluate(inner, whole);
            if (!replacement) {
                out.push_back(input[i]);
                ++i;
                continue;
            }

            out.append(*replacement);
            i = close + 2;
        }

        return out;
    }

    bool CaseInsensitiveLess::operator()(std::string_view a, std::string_view b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
    }
}  // namespace string_utils
