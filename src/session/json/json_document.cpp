#include "json_document.hpp"

#include <simdjson.h>

#include <cctype>
#include <memory>
#include <string>

#include "../../utils/string_utils.hpp"

namespace session::json {
    namespace {
        bool lookup_property(simdjson::dom::element current, std::string_view name, simdjson::dom::element& out) {
            simdjson::dom::object object;
            if (current.get_object().get(object) != simdjson::SUCCESS) {
                return false;
            }
            return object.at_key(name).get(out) == simdjson::SUCCESS;
        }

        bool lookup_index(simdjson::dom::element current, std::string_view index_text, simdjson::dom::element& out) {
            const auto index = string_utils::parse_integer(index_text);
            if (!index || *index < 0) {
                return false;
            }

            simdjson::dom::array array;
            if (current.get_array().get(array) != simdjson::SUCCESS) {
                return false;
            }
            if (static_cast<size_t>(*index) >= array.size()) {
                return false;
            }
            return array.at(static_cast<size_t>(*index)).get(out) == simdjson::SUCCESS;
        }
    }  // namespace

    std::unique_ptr<JsonDocument> JsonDocument::parse(std::string_view text) {
        if (string_utils::is_blank(text)) {
            return nullptr;
        }

        auto document = std::make_unique<JsonDocument>(Passkey{});
        if (document->parser_.parse(text.data(), text.size()).get(document->root_) != simdjson::SUCCESS) {
            return nullptr;
        }

        return document;
    }

    std::optional<std::string> JsonDocument::navigate(std::string_view path) const {
        simdjson::dom::element current = root_;

        for (const std::string& segment : string_utils::split(path, '.')) {
            const size_t bracket = segment.find('[');

            if (bracket == std::string::npos) {
                if (!lookup_property(current, segment, current)) {
                    return std::nullopt;
                }
                continue;
            }

            const std::string_view property = std::string_view(segment).substr(0, bracket);
            std::string_view index_text = std::string_view(segment).substr(bracket + 1);
            while (!index_text.empty() && index_text.back() == ']') {
                index_text.remove_suffix(1);
            }

            if (!property.empty() && !lookup_property(current, property, current)) {
                return std::nullopt;
            }
            if (!lookup_index(current, index_text, current)) {
                return std::nullopt;
            }
        }

        return stringify(current);
    }

    std::string JsonDocument::to_string() const { return stringify(root_); }

    std::string JsonDocument::stringify(simdjson::dom::element element) {
        switch (element.type()) {
            case simdjson::dom::element_type::STRING: {
                std::string_view text;
                if (element.get_string().get(text) != simdjson::SUCCESS) {
                    return {};
                }
                return std::string(text);
            }
            case simdjson::dom::element_type::BOOL: {
                bool value = false;
                if (element.get_bool().get(value) != simdjson::SUCCESS) {
                    return {};
                }
                return value ? "true" : "false";
            }
            case simdjson::dom::element_type::NULL_VALUE:
                return "null";
            default:
                return simdjson::minify(element);
        }
    }
}  // namespace session::json
