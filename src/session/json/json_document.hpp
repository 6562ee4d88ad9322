#ifndef COURIER_JSON_DOCUMENT_HPP
#define COURIER_JSON_DOCUMENT_HPP

#include <simdjson.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace session::json {
    // A parsed response body. Owns the parser arena its element tree points into, so it is
    // neither copyable nor movable; hold it through a unique_ptr.
    class JsonDocument {
        // Only parse() can mint one, which keeps construction going through it
        struct Passkey {
            explicit Passkey() = default;
        };

       public:
        explicit JsonDocument(Passkey /*key*/) {}

        // Returns nullptr when `text` is not valid JSON.
        static std::unique_ptr<JsonDocument> parse(std::string_view text);

        ~JsonDocument() = default;
        JsonDocument(const JsonDocument&) = delete;
        JsonDocument& operator=(const JsonDocument&) = delete;
        JsonDocument(JsonDocument&&) = delete;
        JsonDocument& operator=(JsonDocument&&) = delete;

        // Dot-separated path, each segment optionally ending in one [index]:
        // "user.name", "tags[1]", "items[0].id", "[2]". Returns nullopt when the path does not
        // lead anywhere.
        [[nodiscard]] std::optional<std::string> navigate(std::string_view path) const;

        [[nodiscard]] std::string to_string() const;

        // Strings yield their text, numbers their canonical form, true/false/null their
        // literal, and objects/arrays their minified JSON.
        static std::string stringify(simdjson::dom::element element);

       private:
        simdjson::dom::parser parser_;
        simdjson::dom::element root_;
    };
}  // namespace session::json

#endif
