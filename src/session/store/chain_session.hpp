#ifndef COURIER_CHAIN_SESSION_HPP
#define COURIER_CHAIN_SESSION_HPP

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../../http/model/header_map.hpp"
#include "../../utils/string_utils.hpp"
#include "../json/json_document.hpp"

namespace session {
    struct StoredResponse {
        long status_code_ = 0;
        http::model::HeaderMap headers_;
        std::string body_;
        std::chrono::system_clock::time_point timestamp_{};
    };

    enum class ReferenceKind { BODY, HEADERS };

    // {{<request>.response.<body|headers>[.<path>]}}
    struct ChainReference {
        std::string request_;
        ReferenceKind kind_ = ReferenceKind::BODY;
        std::string path_;
    };

    // `inner` is the text between the braces, untrimmed.
    std::optional<ChainReference> parse_chain_reference(std::string_view inner);

    // Responses of named requests, kept for the lifetime of the session so later requests can
    // refer back to them. Names compare case-insensitively; storing under an existing name
    // replaces the whole entry.
    class ChainSession {
       public:
        ChainSession() = default;

        ~ChainSession() = default;
        ChainSession(const ChainSession&) = delete;
        ChainSession& operator=(const ChainSession&) = delete;
        ChainSession(ChainSession&&) = delete;
        ChainSession& operator=(ChainSession&&) = delete;

        void store_response(const std::string& request_name, StoredResponse response);
        [[nodiscard]] std::string resolve_chain_references(std::string_view input) const;
        void clear_session();

        [[nodiscard]] std::vector<std::string> stored_request_names() const;
        [[nodiscard]] std::optional<StoredResponse> find(std::string_view request_name) const;
        [[nodiscard]] bool has_structured_body(std::string_view request_name) const;

       private:
        struct Entry {
            StoredResponse response_;
            std::unique_ptr<json::JsonDocument> parsed_body_;
        };

        [[nodiscard]] std::optional<std::string> resolve_reference_locked(const ChainReference& reference) const;

        mutable std::mutex mutex_;
        std::map<std::string, Entry, string_utils::CaseInsensitiveLess> entries_;
    };
}  // namespace session

#endif
