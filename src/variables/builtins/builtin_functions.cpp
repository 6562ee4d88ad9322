#include "builtin_functions.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "../../utils/string_utils.hpp"

using namespace std::chrono;

namespace variables::builtins {
    namespace {
        const size_t GUID_BYTES = 16;
        const size_t DATETIME_BUFFER_SIZE = 256;

        std::mt19937_64& rng() {
            thread_local std::mt19937_64 engine{std::random_device{}()};
            return engine;
        }

        // "$name" or "$name <parameter>"; anything else is a different function.
        bool matches_function(std::string_view expression, std::string_view function, std::string_view& parameter) {
            if (!expression.starts_with(function)) {
                return false;
            }

            std::string_view rest = expression.substr(function.size());
            if (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.front())) == 0) {
                return false;
            }

            parameter = string_utils::trim_view(rest);
            return true;
        }

        std::tm to_utc_tm(system_clock::time_point at) {
            const std::time_t t = system_clock::to_time_t(at);
            std::tm tm{};
            gmtime_r(&t, &tm);
            return tm;
        }

        std::string_view strip_quotes(std::string_view s) {
            if (s.size() >= 2 && (s.front() == '\'' || s.front() == '"') && s.back() == s.front()) {
                return s.substr(1, s.size() - 2);
            }
            return s;
        }

        std::optional<int> parse_int(std::string_view s) {
            const auto parsed = string_utils::parse_integer(s);
            if (!parsed || *parsed < std::numeric_limits<int>::min() || *parsed > std::numeric_limits<int>::max()) {
                return std::nullopt;
            }
            return static_cast<int>(*parsed);
        }
    }  // namespace

    std::optional<std::string> evaluate(std::string_view expression) {
        std::string_view parameter;

        if (matches_function(expression, FunctionNames::DATETIME, parameter)) {
            return format_datetime(system_clock::now(), parameter);
        }
        if (matches_function(expression, FunctionNames::GUID, parameter)) {
            return generate_guid();
        }
        if (matches_function(expression, FunctionNames::RANDOM_INT, parameter)) {
            return random_int(parameter);
        }
        if (matches_function(expression, FunctionNames::TIMESTAMP, parameter)) {
            return unix_timestamp(system_clock::now());
        }
        if (matches_function(expression, FunctionNames::PROCESS_ENV, parameter)) {
            return process_env(parameter);
        }
        if (matches_function(expression, FunctionNames::DOTENV, parameter)) {
            // .env files are not read; the name is reserved so documents using it stay stable
            return std::string{};
        }

        return std::nullopt;
    }

    std::string format_datetime(system_clock::time_point at, std::string_view format) {
        const std::tm tm = to_utc_tm(at);
        format = strip_quotes(format);

        if (format.empty() || string_utils::iequals(format, DatetimeFormats::ISO8601)) {
            const auto ms = duration_cast<milliseconds>(at.time_since_epoch()).count() % 1000;
            std::ostringstream out;
            out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
            return out.str();
        }

        if (string_utils::iequals(format, DatetimeFormats::RFC1123)) {
            std::array<char, DATETIME_BUFFER_SIZE> buffer{};
            const size_t n = std::strftime(buffer.data(), buffer.size(), "%a, %d %b %Y %H:%M:%S GMT", &tm);
            return {buffer.data(), n};
        }

        const std::string custom(format);
        std::array<char, DATETIME_BUFFER_SIZE> buffer{};
        const size_t n = std::strftime(buffer.data(), buffer.size(), custom.c_str(), &tm);
        return {buffer.data(), n};
    }

    std::string generate_guid() {
        std::array<unsigned char, GUID_BYTES> bytes{};
        std::uniform_int_distribution<int> byte_dist(0, 255);
        for (auto& b : bytes) {
            b = static_cast<unsigned char>(byte_dist(rng()));
        }

        // RFC 4122 version 4, variant 10xx
        bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

        std::string out;
        out.reserve(36);
        std::array<char, 3> hex{};
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out.push_back('-');
            }
            std::snprintf(hex.data(), hex.size(), "%02x", bytes[i]);
            out.append(hex.data(), 2);
        }
        return out;
    }

    std::string random_int(std::string_view parameters) {
        int min = 0;
        int max = std::numeric_limits<int>::max();

        std::vector<std::string> parts;
        for (const auto& piece : string_utils::split(parameters, ',')) {
            std::istringstream words(piece);
            std::string word;
            while (words >> word) {
                parts.push_back(word);
            }
        }

        if (!parts.empty()) {
            if (auto v = parse_int(parts[0])) {
                min = *v;
            }
        }
        if (parts.size() >= 2) {
            if (auto v = parse_int(parts[1])) {
                max = *v;
            }
        }

        if (max <= min) {
            return std::to_string(min);
        }

        std::uniform_int_distribution<long long> dist(min, static_cast<long long>(max) - 1);
        return std::to_string(dist(rng()));
    }

    std::string unix_timestamp(system_clock::time_point at) { return std::to_string(duration_cast<seconds>(at.time_since_epoch()).count()); }

    std::string process_env(std::string_view name) {
        if (name.empty()) {
            return {};
        }

        const std::string key(name);
        const char* value = std::getenv(key.c_str());
        return value != nullptr ? std::string(value) : std::string{};
    }
}  // namespace variables::builtins
