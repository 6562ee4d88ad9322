#ifndef COURIER_HEADER_MAP_HPP
#define COURIER_HEADER_MAP_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace http::model {
    // Insertion-ordered header collection with case-insensitive names. The first spelling of a
    // name is kept when a later call overwrites its value.
    class HeaderMap {
       public:
        using Entry = std::pair<std::string, std::string>;
        using const_iterator = std::vector<Entry>::const_iterator;

        void set(std::string_view name, std::string_view value);
        void append(std::string_view name, std::string_view value);
        // Appends, or joins onto an existing value with ", " the way repeated fields combine.
        void merge(std::string_view name, std::string_view value);
        bool remove(std::string_view name);
        void clear() { entries_.clear(); }

        [[nodiscard]] std::optional<std::string> get(std::string_view name) const;
        [[nodiscard]] std::vector<std::string> get_all(std::string_view name) const;
        [[nodiscard]] bool has(std::string_view name) const;

        [[nodiscard]] size_t size() const { return entries_.size(); }
        [[nodiscard]] bool empty() const { return entries_.empty(); }
        [[nodiscard]] const_iterator begin() const { return entries_.begin(); }
        [[nodiscard]] const_iterator end() const { return entries_.end(); }

        bool operator==(const HeaderMap& other) const = default;

       private:
        std::vector<Entry> entries_;
    };
}  // namespace http::model

#endif
