#ifndef COURIER_CURL_EASY_HPP
#define COURIER_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "../error/http_error.hpp"
#include "../model/model.hpp"
#include "curl_share.hpp"
#include "interface.hpp"

struct curl_slist;

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    // Maps a libcurl result code onto the failure kinds the executor reports.
    http::error::ErrorKind classify_curl_code(CURLcode code);

    // classify_curl_code, except that an abort nobody asked for is UNEXPECTED rather than CANCELLED.
    http::error::ErrorKind classify_failure(CURLcode code, bool stop_requested);

    struct StatusLine {
        std::string version_;
        std::string reason_;  // empty when the server sent none, as HTTP/2 never does
    };

    // "HTTP/1.1 404 Not Found" -> {"HTTP/1.1", "Not Found"}
    StatusLine parse_status_line(std::string_view line);

    // One libcurl easy handle. Not safe for concurrent use; make one per in-flight request and
    // hand them a common CurlShare to reuse DNS lookups and TLS sessions.
    class CurlEasy : public IHttpClient {
       public:
        explicit CurlEasy(ClientOptions options, std::shared_ptr<CurlShare> share = nullptr);

        ~CurlEasy() override;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response send(const http::model::Request& req, std::stop_token stop) override;

        void set_url(const std::string& u);
        void set_headers(const std::vector<std::string>& hs);
        void enable_keepalive();
        void enable_compression();

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void perform_throw(const std::string& url);
        http::model::Response make_response(std::string& incoming_body);
        void set_defaults_once();
        void prepare_for_new_request(std::string& body);
        void set_method_and_body(const http::model::Request& req);
        void read_timing(http::model::Timing& timing);

        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);
        static int progress_cb(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);

        ClientOptions options_;

        std::string last_http_version_;
        std::string last_reason_phrase_;
        http::model::HeaderMap last_response_headers_;

        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};
        std::stop_token stop_token_;

        CURL* handle_{};
        std::shared_ptr<CurlShare> share_;
    };
}  // namespace http::client

#endif
