#ifndef COURIER_DOCUMENT_MODEL_HPP
#define COURIER_DOCUMENT_MODEL_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../../http/model/header_map.hpp"
#include "../../utils/string_utils.hpp"

namespace document::model {
    using VariableMap = std::map<std::string, std::string, string_utils::CaseInsensitiveLess>;

    struct RequestDefinition {
        std::optional<std::string> name_;
        std::string method_ = "GET";
        std::string url_;
        http::model::HeaderMap headers_;
        std::optional<std::string> body_;
        VariableMap local_variables_;

        // 1-indexed, inclusive
        int start_line_ = 0;
        int end_line_ = 0;

        [[nodiscard]] bool contains_line(int line) const { return line >= start_line_ && line <= end_line_; }

        bool operator==(const RequestDefinition& other) const = default;
    };

    struct ParsedDocument {
        std::vector<RequestDefinition> requests_;
        VariableMap file_variables_;

        bool operator==(const ParsedDocument& other) const = default;
    };
}  // namespace document::model

#endif
