#include "header_map.hpp"

#include <algorithm>
#include <string>

#include "../../utils/string_utils.hpp"

namespace http::model {
    void HeaderMap::set(std::string_view name, std::string_view value) {
        auto it = std::find_if(entries_.begin(), entries_.end(), [name](const Entry& e) { return string_utils::iequals(e.first, name); });
        if (it == entries_.end()) {
            entries_.emplace_back(std::string(name), std::string(value));
            return;
        }

        it->second = std::string(value);
        entries_.erase(std::remove_if(std::next(it), entries_.end(), [name](const Entry& e) { return string_utils::iequals(e.first, name); }), entries_.end());
    }

    void HeaderMap::append(std::string_view name, std::string_view value) { entries_.emplace_back(std::string(name), std::string(value)); }

    void HeaderMap::merge(std::string_view name, std::string_view value) {
        auto it = std::find_if(entries_.begin(), entries_.end(), [name](const Entry& e) { return string_utils::iequals(e.first, name); });
        if (it == entries_.end()) {
            entries_.emplace_back(std::string(name), std::string(value));
            return;
        }

        it->second.append(", ");
        it->second.append(value);
    }

    bool HeaderMap::remove(std::string_view name) {
        const auto before = entries_.size();
        entries_.erase(std::remove_if(entries_.begin(), entries_.end(), [name](const Entry& e) { return string_utils::iequals(e.first, name); }), entries_.end());
        return entries_.size() != before;
    }

    std::optional<std::string> HeaderMap::get(std::string_view name) const {
        for (const auto& [key, value] : entries_) {
            if (string_utils::iequals(key, name)) {
                return value;
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> HeaderMap::get_all(std::string_view name) const {
        std::vector<std::string> values;
        for (const auto& [key, value] : entries_) {
            if (string_utils::iequals(key, name)) {
                values.push_back(value);
            }
        }
        return values;
    }

    bool HeaderMap::has(std::string_view name) const {
        return std::any_of(entries_.begin(), entries_.end(), [name](const Entry& e) { return string_utils::iequals(e.first, name); });
    }
}  // namespace http::model
