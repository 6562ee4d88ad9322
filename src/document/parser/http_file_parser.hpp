#ifndef COURIER_HTTP_FILE_PARSER_HPP
#define COURIER_HTTP_FILE_PARSER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../model/model.hpp"

namespace document::parser {
    enum class ParserState { SEEKING, HEADERS, BODY };

    enum class LineKind { BLANK, DELIMITER, NAME_DIRECTIVE, VARIABLE, COMMENT, REQUEST_LINE, HEADER, TEXT };

    struct ClassifiedLine {
        LineKind kind_ = LineKind::TEXT;
        std::string name_;
        std::string value_;
    };

    // Classification ignores parser state; the state machine decides what a kind means.
    ClassifiedLine classify_line(std::string_view line);

    // One pass over a .http/.rest document. Owns the in-progress request while its lines are
    // being consumed and emits finished requests into the document.
    class ParseSession {
       public:
        explicit ParseSession(std::vector<std::string> lines);

        document::model::ParsedDocument run();

        void on_delimiter(int line_number);
        void on_name_directive(const std::string& name);
        void on_variable(const std::string& name, const std::string& value);
        void on_request_line(const ClassifiedLine& line, int line_number);
        void on_header(const ClassifiedLine& line);
        void on_blank();
        void on_body_line(const std::string& line);
        void finish_request(int end_line);

        [[nodiscard]] ParserState state() const { return state_; }
        [[nodiscard]] const std::optional<std::string>& pending_name() const { return pending_name_; }
        [[nodiscard]] const document::model::RequestDefinition& current() const { return current_; }
        [[nodiscard]] const document::model::ParsedDocument& document() const { return document_; }

       private:
        void reset_current();

        std::vector<std::string> lines_;
        ParserState state_ = ParserState::SEEKING;
        document::model::RequestDefinition current_;
        std::vector<std::string> body_lines_;
        std::optional<std::string> pending_name_;
        document::model::ParsedDocument document_;
    };

    class HttpFileParser {
       public:
        [[nodiscard]] document::model::ParsedDocument parse(std::string_view content) const;

        // `line_number` is 1-indexed. Returns the first request whose span contains it.
        [[nodiscard]] std::optional<document::model::RequestDefinition> find_request_at(std::string_view content, int line_number) const;
    };
}  // namespace document::parser

#endif
