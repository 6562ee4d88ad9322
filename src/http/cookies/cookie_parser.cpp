#include "cookie_parser.hpp"

#include <curl/curl.h>

#include <string>
#include <vector>

#include "../../utils/string_utils.hpp"

namespace http::cookies {
    std::optional<Cookie> parse_set_cookie(std::string_view header_value) {
        if (string_utils::is_blank(header_value)) {
            return std::nullopt;
        }

        const std::vector<std::string> parts = string_utils::split(header_value, ';');

        const std::string& pair = parts.front();
        const size_t eq = pair.find('=');
        if (eq == std::string::npos) {
            return std::nullopt;
        }

        Cookie cookie;
        cookie.raw_value_ = std::string(header_value);
        cookie.name_ = string_utils::trim(pair.substr(0, eq));
        cookie.value_ = string_utils::trim(pair.substr(eq + 1));

        for (size_t i = 1; i < parts.size(); ++i) {
            const std::string_view attribute = string_utils::trim_view(parts[i]);
            const size_t attr_eq = attribute.find('=');
            const std::string_view name = string_utils::trim_view(attribute.substr(0, attr_eq));
            const std::string_view value = attr_eq == std::string_view::npos ? std::string_view{} : string_utils::trim_view(attribute.substr(attr_eq + 1));

            if (string_utils::iequals(name, AttributeNames::DOMAIN)) {
                cookie.domain_ = std::string(value);
            } else if (string_utils::iequals(name, AttributeNames::PATH)) {
                cookie.path_ = std::string(value);
            } else if (string_utils::iequals(name, AttributeNames::EXPIRES)) {
                cookie.expires_ = parse_cookie_date(value);
            } else if (string_utils::iequals(name, AttributeNames::HTTP_ONLY)) {
                cookie.http_only_ = true;
            } else if (string_utils::iequals(name, AttributeNames::SECURE)) {
                cookie.secure_ = true;
            } else if (string_utils::iequals(name, AttributeNames::SAME_SITE)) {
                cookie.same_site_ = std::string(value);
            }
        }

        return cookie;
    }

    std::optional<std::chrono::system_clock::time_point> parse_cookie_date(std::string_view text) {
        if (string_utils::is_blank(text)) {
            return std::nullopt;
        }

        // curl_getdate understands the RFC 1123, RFC 850 and asctime forms servers send
        const std::string date(text);
        const time_t parsed = curl_getdate(date.c_str(), nullptr);
        if (parsed == -1) {
            return std::nullopt;
        }

        return std::chrono::system_clock::from_time_t(parsed);
    }
}  // namespace http::cookies
