#include "chain_session.hpp"

#include <cctype>
#include <mutex>
#include <string>
#include <vector>

#include "../../utils/logging.hpp"

using namespace std::chrono;

namespace session {
    namespace {
        struct ReferenceKeywords {
            static constexpr std::string_view RESPONSE = ".response.";
            static constexpr std::string_view BODY = "body";
            static constexpr std::string_view HEADERS = "headers";
        };

        bool is_identifier_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_'; }

        bool is_identifier_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; }
    }  // namespace

    std::optional<ChainReference> parse_chain_reference(std::string_view inner) {
        if (inner.empty() || !is_identifier_start(inner.front())) {
            return std::nullopt;
        }

        size_t end = 1;
        while (end < inner.size() && is_identifier_char(inner[end])) {
            ++end;
        }

        ChainReference reference;
        reference.request_ = std::string(inner.substr(0, end));

        std::string_view rest = inner.substr(end);
        if (!rest.starts_with(ReferenceKeywords::RESPONSE)) {
            return std::nullopt;
        }
        rest.remove_prefix(ReferenceKeywords::RESPONSE.size());

        if (rest.starts_with(ReferenceKeywords::HEADERS)) {
            reference.kind_ = ReferenceKind::HEADERS;
            rest.remove_prefix(ReferenceKeywords::HEADERS.size());
        } else if (rest.starts_with(ReferenceKeywords::BODY)) {
            reference.kind_ = ReferenceKind::BODY;
            rest.remove_prefix(ReferenceKeywords::BODY.size());
        } else {
            return std::nullopt;
        }

        if (rest.empty()) {
            return reference;
        }
        if (rest.front() != '.' || rest.size() < 2) {
            return std::nullopt;
        }

        reference.path_ = std::string(rest.substr(1));
        return reference;
    }

    void ChainSession::store_response(const std::string& request_name, StoredResponse response) {
        if (request_name.empty()) {
            return;
        }

        Entry entry;
        entry.parsed_body_ = json::JsonDocument::parse(response.body_);
        entry.response_ = std::move(response);
        entry.response_.timestamp_ = system_clock::now();

        logging::get_logger()->debug("Stored response '{}' ({} bytes, {})", request_name, entry.response_.body_.size(),
                                     entry.parsed_body_ ? "structured" : "opaque");

        std::lock_guard<std::mutex> lock(mutex_);
        entries_.insert_or_assign(request_name, std::move(entry));
    }

    std::string ChainSession::resolve_chain_references(std::string_view input) const {
        if (input.empty()) {
            return {};
        }

        std::lock_guard<std::mutex> lock(mutex_);

        return string_utils::replace_placeholders(input, [this](std::string_view inner, std::string_view whole) -> std::optional<std::string> {
            const std::optional<ChainReference> reference = parse_chain_reference(inner);
            if (!reference) {
                return std::nullopt;
            }

            if (auto value = resolve_reference_locked(*reference)) {
                return value;
            }
            return std::string(whole);
        });
    }

    void ChainSession::clear_session() {
        std::lock_guard<std::mutex> lock(mutex_);
        logging::get_logger()->debug("Clearing {} stored response(s)", entries_.size());
        entries_.clear();
    }

    std::vector<std::string> ChainSession::stored_request_names() const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<std::string> names;
        names.reserve(entries_.size());
        for (const auto& [name, _] : entries_) {
            names.push_back(name);
        }
        return names;
    }

    std::optional<StoredResponse> ChainSession::find(std::string_view request_name) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = entries_.find(request_name);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second.response_;
    }

    bool ChainSession::has_structured_body(std::string_view request_name) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = entries_.find(request_name);
        return it != entries_.end() && it->second.parsed_body_ != nullptr;
    }

    std::optional<std::string> ChainSession::resolve_reference_locked(const ChainReference& reference) const {
        auto it = entries_.find(reference.request_);
        if (it == entries_.end()) {
            return std::nullopt;
        }

        const Entry& entry = it->second;

        if (reference.kind_ == ReferenceKind::HEADERS) {
            if (reference.path_.empty()) {
                return std::nullopt;
            }
            return entry.response_.headers_.get(reference.path_);
        }

        if (reference.path_.empty()) {
            return entry.response_.body_;
        }
        if (!entry.parsed_body_) {
            return std::nullopt;
        }
        return entry.parsed_body_->navigate(reference.path_);
    }
}  // namespace session
