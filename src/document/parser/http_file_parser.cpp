#include "http_file_parser.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"

namespace document::parser {
    namespace {
        bool is_identifier_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_'; }

        bool is_identifier_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; }

        bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

        // # @name <token>
        bool match_name_directive(std::string_view line, ClassifiedLine& out) {
            if (line.empty() || line.front() != '#') {
                return false;
            }

            std::string_view rest = line.substr(1);
            while (!rest.empty() && is_space(rest.front())) {
                rest.remove_prefix(1);
            }
            if (!string_utils::istarts_with(rest, "@name")) {
                return false;
            }

            rest.remove_prefix(5);
            if (rest.empty() || !is_space(rest.front())) {
                return false;
            }
            while (!rest.empty() && is_space(rest.front())) {
                rest.remove_prefix(1);
            }
            if (rest.empty() || std::any_of(rest.begin(), rest.end(), is_space)) {
                return false;
            }

            out.kind_ = LineKind::NAME_DIRECTIVE;
            out.name_ = std::string(rest);
            return true;
        }

        // @ident = value
        bool match_variable(std::string_view line, ClassifiedLine& out) {
            if (line.size() < 2 || line.front() != '@' || !is_identifier_start(line[1])) {
                return false;
            }

            size_t end = 2;
            while (end < line.size() && is_identifier_char(line[end])) {
                ++end;
            }

            size_t eq = end;
            while (eq < line.size() && is_space(line[eq])) {
                ++eq;
            }
            if (eq >= line.size() || line[eq] != '=') {
                return false;
            }

            out.kind_ = LineKind::VARIABLE;
            out.name_ = std::string(line.substr(1, end - 1));
            out.value_ = std::string(string_utils::trim_view(line.substr(eq + 1)));
            return true;
        }

        bool is_comment(std::string_view line) {
            while (!line.empty() && is_space(line.front())) {
                line.remove_prefix(1);
            }
            return line.starts_with('#') || line.starts_with("//");
        }

        // METHOD <url>, method anchored at column 0
        bool match_request_line(std::string_view line, ClassifiedLine& out) {
            const auto method_end = std::find_if(line.begin(), line.end(), is_space);
            const std::string_view method = line.substr(0, static_cast<size_t>(method_end - line.begin()));
            if (method.size() + 1 >= line.size()) {
                return false;
            }

            const bool known =
                std::any_of(constants::HTTP_METHODS.begin(), constants::HTTP_METHODS.end(), [method](std::string_view m) { return string_utils::iequals(m, method); });
            if (!known) {
                return false;
            }

            out.kind_ = LineKind::REQUEST_LINE;
            out.name_ = string_utils::to_upper(method);
            out.value_ = std::string(string_utils::trim_view(line.substr(method.size())));
            return true;
        }

        // Name: value
        bool match_header(std::string_view line, ClassifiedLine& out) {
            const size_t colon = line.find(':');
            if (colon == std::string_view::npos || colon == 0) {
                return false;
            }

            const std::string_view name = string_utils::trim_view(line.substr(0, colon));
            if (name.empty()) {
                return false;
            }

            out.kind_ = LineKind::HEADER;
            out.name_ = std::string(name);
            out.value_ = std::string(string_utils::trim_view(line.substr(colon + 1)));
            return true;
        }
    }  // namespace

    ClassifiedLine classify_line(std::string_view line) {
        ClassifiedLine out;

        if (line.starts_with("###")) {
            out.kind_ = LineKind::DELIMITER;
            return out;
        }
        if (match_name_directive(line, out) || match_variable(line, out)) {
            return out;
        }
        if (is_comment(line)) {
            out.kind_ = LineKind::COMMENT;
            return out;
        }
        if (match_request_line(line, out)) {
            return out;
        }
        if (string_utils::is_blank(line)) {
            out.kind_ = LineKind::BLANK;
            return out;
        }
        if (match_header(line, out)) {
            return out;
        }

        out.kind_ = LineKind::TEXT;
        return out;
    }

    ParseSession::ParseSession(std::vector<std::string> lines) : lines_(std::move(lines)) {}

    document::model::ParsedDocument ParseSession::run() {
        for (size_t i = 0; i < lines_.size(); ++i) {
            const std::string& line = lines_[i];
            const int line_number = static_cast<int>(i) + 1;

            if (state_ == ParserState::SEEKING && string_utils::is_blank(line)) {
                continue;
            }

            const ClassifiedLine classified = classify_line(line);

            switch (classified.kind_) {
                case LineKind::DELIMITER:
                    on_delimiter(line_number);
                    continue;
                case LineKind::NAME_DIRECTIVE:
                    on_name_directive(classified.name_);
                    continue;
                case LineKind::VARIABLE:
                    on_variable(classified.name_, classified.value_);
                    continue;
                case LineKind::COMMENT:
                    continue;
                default:
                    break;
            }

            switch (state_) {
                case ParserState::SEEKING:
                    if (classified.kind_ == LineKind::REQUEST_LINE) {
                        on_request_line(classified, line_number);
                    }
                    break;
                case ParserState::HEADERS:
                    if (classified.kind_ == LineKind::BLANK) {
                        on_blank();
                    } else {
                        // A request line here is just text; it only counts if it also looks like a header
                        ClassifiedLine header;
                        if (match_header(line, header)) {
                            on_header(header);
                        }
                    }
                    break;
                case ParserState::BODY:
                    on_body_line(line);
                    break;
            }
        }

        if (state_ != ParserState::SEEKING) {
            finish_request(static_cast<int>(lines_.size()));
        }

        return std::move(document_);
    }

    void ParseSession::on_delimiter(int line_number) {
        if (state_ != ParserState::SEEKING) {
            finish_request(line_number - 1);
        }

        reset_current();
        pending_name_.reset();
    }

    void ParseSession::on_name_directive(const std::string& name) { pending_name_ = name; }

    void ParseSession::on_variable(const std::string& name, const std::string& value) {
        if (state_ == ParserState::SEEKING) {
            document_.file_variables_[name] = value;
        } else {
            current_.local_variables_[name] = value;
        }
    }

    void ParseSession::on_request_line(const ClassifiedLine& line, int line_number) {
        if (pending_name_) {
            current_.name_ = std::move(*pending_name_);
            pending_name_.reset();
        }

        current_.method_ = line.name_;
        current_.url_ = line.value_;
        current_.start_line_ = line_number;
        state_ = ParserState::HEADERS;
    }

    void ParseSession::on_header(const ClassifiedLine& line) { current_.headers_.set(line.name_, line.value_); }

    void ParseSession::on_blank() { state_ = ParserState::BODY; }

    void ParseSession::on_body_line(const std::string& line) { body_lines_.push_back(line); }

    void ParseSession::finish_request(int end_line) {
        current_.end_line_ = end_line;

        while (!body_lines_.empty() && string_utils::is_blank(body_lines_.back())) {
            body_lines_.pop_back();
        }
        if (!body_lines_.empty()) {
            current_.body_ = string_utils::join(body_lines_, "\n");
        }

        if (current_.url_.empty()) {
            logging::get_logger()->trace("Discarding request at line {} without a URL", current_.start_line_);
        } else {
            document_.requests_.push_back(std::move(current_));
        }

        reset_current();
    }

    void ParseSession::reset_current() {
        current_ = document::model::RequestDefinition{};
        body_lines_.clear();
        state_ = ParserState::SEEKING;
    }

    document::model::ParsedDocument HttpFileParser::parse(std::string_view content) const {
        ParseSession session(string_utils::split_lines(content));
        return session.run();
    }

    std::optional<document::model::RequestDefinition> HttpFileParser::find_request_at(std::string_view content, int line_number) const {
        document::model::ParsedDocument parsed = parse(content);

        auto it = std::find_if(parsed.requests_.begin(), parsed.requests_.end(),
                               [line_number](const document::model::RequestDefinition& r) { return r.contains_line(line_number); });
        if (it == parsed.requests_.end()) {
            return std::nullopt;
        }

        return std::move(*it);
    }
}  // namespace document::parser
