#include "curl_easy.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <string>
#include <vector>

#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../model/model.hpp"
#include "../model/status_codes.hpp"

using namespace std::chrono;

namespace http::client {

    struct CurlDefaults {
        static constexpr long NO_PROGRESS = 0L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long TCP_KEEPALIVE = 1L;
        static constexpr long TCP_KEEPIDLE = 120L;
        static constexpr long TCP_KEEPINTVL = 60L;
        static constexpr long POST = 0L;
        static constexpr long NO_BODY = 0L;
        static constexpr long HTTP_GET = 1L;
        static constexpr const char* CUSTOM_REQUEST = nullptr;
        static constexpr const char* ACCEPT_ENCODING = "gzip, deflate";
        static constexpr const char* EMPTY_BODY = "";
        static constexpr const char* NO_POST_FIELDS = nullptr;
        static constexpr curl_off_t UNKNOWN_POST_SIZE = -1;
        // Suppresses libcurl's "Expect: 100-continue" on larger bodies
        static constexpr const char* NO_EXPECT_HEADER = "Expect:";
    };

    struct Methods {
        static constexpr const char* GET = "GET";
        static constexpr const char* HEAD = "HEAD";
        static constexpr const char* POST = "POST";
        static constexpr const char* PUT = "PUT";
        static constexpr const char* PATCH = "PATCH";
    };

    struct HeaderKeys {
        static constexpr const char* STATUS_LINE = "HTTP/";
    };

    error::ErrorKind classify_curl_code(CURLcode code) {
        switch (code) {
            case CURLE_ABORTED_BY_CALLBACK:
                return error::ErrorKind::CANCELLED;
            case CURLE_OPERATION_TIMEDOUT:
                return error::ErrorKind::TIMEOUT;
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_CONNECT:
            case CURLE_WEIRD_SERVER_REPLY:
            case CURLE_HTTP2:
            case CURLE_HTTP2_STREAM:
            case CURLE_PARTIAL_FILE:
            case CURLE_SEND_ERROR:
            case CURLE_RECV_ERROR:
            case CURLE_GOT_NOTHING:
            case CURLE_SSL_CONNECT_ERROR:
            case CURLE_SSL_CERTPROBLEM:
            case CURLE_SSL_CIPHER:
            case CURLE_SSL_CACERT_BADFILE:
            case CURLE_PEER_FAILED_VERIFICATION:
            case CURLE_TOO_MANY_REDIRECTS:
            case CURLE_BAD_CONTENT_ENCODING:
                return error::ErrorKind::TRANSPORT;
            default:
                return error::ErrorKind::UNEXPECTED;
        }
    }

    error::ErrorKind classify_failure(CURLcode code, bool stop_requested) {
        const error::ErrorKind kind = classify_curl_code(code);
        // Only the progress callback aborts, and only for a stop request
        if (kind == error::ErrorKind::CANCELLED && !stop_requested) {
            return error::ErrorKind::UNEXPECTED;
        }
        return kind;
    }

    StatusLine parse_status_line(std::string_view line) {
        StatusLine out;
        const size_t version_end = line.find(' ');
        out.version_ = std::string(line.substr(0, version_end));

        if (version_end != std::string_view::npos) {
            const std::string_view rest = ::string_utils::trim_view(line.substr(version_end + 1));
            const size_t code_end = rest.find(' ');
            if (code_end != std::string_view::npos) {
                out.reason_ = std::string(::string_utils::trim_view(rest.substr(code_end + 1)));
            }
        }
        return out;
    }

    CurlEasy::CurlEasy(ClientOptions options, std::shared_ptr<CurlShare> share)
        : options_(std::move(options)), handle_(curl_easy_init()), share_(std::move(share)) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults_once();
    }

    CurlEasy::~CurlEasy() {
        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }

        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }
    }

    void CurlEasy::set_url(const std::string& u) { setopt(CURLOPT_URL, u.c_str()); }

    void CurlEasy::set_headers(const std::vector<std::string>& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& h : hs) {
            curl_slist* appended = curl_slist_append(headers_, h.c_str());
            if (appended == nullptr) {
                throw std::runtime_error("curl_slist_append failed");
            }
            headers_ = appended;
        }
        // nullptr clears whatever the previous request installed
        setopt(CURLOPT_HTTPHEADER, headers_);
    }

    void CurlEasy::set_defaults_once() {
        const long timeout_ms = static_cast<long>(options_.timeout_.count());
        const long connect_timeout_ms = std::min(static_cast<long>(options_.connect_timeout_.count()), timeout_ms);

        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, options_.follow_redirects_ ? 1L : 0L);
        setopt(CURLOPT_MAXREDIRS, options_.max_redirects_);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms);
        setopt(CURLOPT_TIMEOUT_MS, timeout_ms);
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_XFERINFOFUNCTION, &CurlEasy::progress_cb);
        setopt(CURLOPT_XFERINFODATA, static_cast<void*>(this));
        setopt(CURLOPT_USERAGENT, options_.user_agent_.c_str());
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps

        if (share_) {
            setopt(CURLOPT_SHARE, share_->handle());
        }

        enable_keepalive();

        if (options_.auto_decompress_) {
            enable_compression();
        }
    }

    void CurlEasy::enable_keepalive() {
        setopt(CURLOPT_TCP_KEEPALIVE, CurlDefaults::TCP_KEEPALIVE);
        setopt(CURLOPT_TCP_KEEPIDLE, CurlDefaults::TCP_KEEPIDLE);
        setopt(CURLOPT_TCP_KEEPINTVL, CurlDefaults::TCP_KEEPINTVL);
    }

    void CurlEasy::enable_compression() { setopt(CURLOPT_ACCEPT_ENCODING, CurlDefaults::ACCEPT_ENCODING); }

    void CurlEasy::prepare_for_new_request(std::string& body) {
        // Clear per-request scratch
        last_response_headers_.clear();
        last_http_version_.clear();
        last_reason_phrase_.clear();
        error_buf_[0] = '\0';
        body.clear();

        setopt(CURLOPT_WRITEFUNCTION, &::string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, static_cast<void*>(&body));
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, static_cast<void*>(this));

        // Undo whatever verb and body the previous request on this handle used. POSTFIELDS goes
        // first because setting it also switches the handle to POST.
        setopt(CURLOPT_POSTFIELDS, CurlDefaults::NO_POST_FIELDS);
        setopt(CURLOPT_POSTFIELDSIZE_LARGE, CurlDefaults::UNKNOWN_POST_SIZE);
        setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
        setopt(CURLOPT_POST, CurlDefaults::POST);
        setopt(CURLOPT_NOBODY, CurlDefaults::NO_BODY);
        setopt(CURLOPT_CUSTOMREQUEST, CurlDefaults::CUSTOM_REQUEST);
    }

    void CurlEasy::set_method_and_body(const http::model::Request& req) {
        const std::string& method = req.method_;

        if (method == Methods::HEAD) {
            setopt(CURLOPT_NOBODY, 1L);
            return;
        }

        if (req.body_) {
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body_->size()));
            setopt(CURLOPT_POSTFIELDS, req.body_->c_str());
            if (method != Methods::POST) {
                setopt(CURLOPT_CUSTOMREQUEST, method.c_str());
            }
            return;
        }

        if (method == Methods::GET) {
            return;
        }

        // Bodiless POST/PUT/PATCH still announce Content-Length: 0
        if (method == Methods::POST || method == Methods::PUT || method == Methods::PATCH) {
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(0));
            setopt(CURLOPT_POSTFIELDS, CurlDefaults::EMPTY_BODY);
        }
        if (method != Methods::POST) {
            setopt(CURLOPT_CUSTOMREQUEST, method.c_str());
        }
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;

        std::string_view line(buffer, bytes);
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.remove_suffix(1);
        }

        // Every status line starts a new response (redirect hop or interim 1xx); keep only the last
        if (::string_utils::ieq_prefix(line.data(), line.size(), HeaderKeys::STATUS_LINE)) {
            self->last_response_headers_.clear();

            StatusLine status = parse_status_line(line);
            self->last_http_version_ = std::move(status.version_);
            self->last_reason_phrase_ = std::move(status.reason_);
            return bytes;
        }

        const size_t colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return bytes;
        }

        self->last_response_headers_.append(::string_utils::trim_view(line.substr(0, colon)), ::string_utils::trim_view(line.substr(colon + 1)));
        return bytes;
    }

    int CurlEasy::progress_cb(void* userdata, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/, curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
        const auto* self = static_cast<CurlEasy*>(userdata);
        return self->stop_token_.stop_requested() ? 1 : 0;
    }

    http::model::Response CurlEasy::send(const http::model::Request& req, std::stop_token stop) {
        if (stop.stop_requested()) {
            throw error::HttpError(error::ErrorKind::CANCELLED, CURLE_ABORTED_BY_CALLBACK, req.url_, "Request was cancelled before it was sent");
        }

        std::vector<std::string> hdrs = req.headers_;
        if (req.body_ && req.method_ != Methods::HEAD) {
            hdrs.insert(hdrs.end(), req.content_headers_.begin(), req.content_headers_.end());
            hdrs.emplace_back(CurlDefaults::NO_EXPECT_HEADER);
        }

        std::string body;
        prepare_for_new_request(body);
        set_url(req.url_);
        set_method_and_body(req);
        set_headers(hdrs);

        stop_token_ = std::move(stop);
        perform_throw(req.url_);
        stop_token_ = {};

        return make_response(body);
    }

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }
    // explicit instantiations for used types (optional but can help some compilers)
    template void CurlEasy::setopt<long>(int, long);
    template void CurlEasy::setopt<const char*>(int, const char*);
    template void CurlEasy::setopt<void*>(int, void*);

    void CurlEasy::perform_throw(const std::string& url) {
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        const error::ErrorKind kind = classify_failure(rc, stop_token_.stop_requested());
        stop_token_ = {};

        // No pre-transfer mark means the connect (and TLS) phase never finished
        bool during_connect = false;
        if (kind == error::ErrorKind::TIMEOUT) {
            curl_off_t pre_transfer = 0;
            during_connect = curl_easy_getinfo(handle_, CURLINFO_PRETRANSFER_TIME_T, &pre_transfer) == CURLE_OK && pre_transfer == 0;
        }

        std::string err = error_buf_[0] != '\0' ? std::string(error_buf_.data()) : std::string(curl_easy_strerror(rc));

        logging::get_logger()->debug("curl_easy_perform failed for {}: {} (code {}, {})", url, err, static_cast<int>(rc), error::to_string(kind));

        throw error::HttpError(kind, static_cast<long>(rc), url, err, during_connect);
    }

    http::model::Response CurlEasy::make_response(std::string& incoming_body) {
        long code = 0;
        if (curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code) != CURLE_OK) {
            throw std::runtime_error("curl_easy_getinfo could not read the response code");
        }

        char* eff = nullptr;
        char* content_type = nullptr;
        long redirects = 0;
        if (curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff) != CURLE_OK) {
            eff = nullptr;
        }
        if (curl_easy_getinfo(handle_, CURLINFO_CONTENT_TYPE, &content_type) != CURLE_OK) {
            content_type = nullptr;
        }
        if (curl_easy_getinfo(handle_, CURLINFO_REDIRECT_COUNT, &redirects) != CURLE_OK) {
            redirects = 0;
        }

        http::model::Response r;
        r.status_ = code;
        r.redirect_count_ = redirects;
        r.body_ = std::move(incoming_body);
        r.effective_url_ = eff != nullptr ? eff : std::string{};
        r.content_type_ = content_type != nullptr ? content_type : std::string{};
        r.http_version_ = std::move(last_http_version_);
        r.reason_phrase_ = std::move(last_reason_phrase_);
        if (r.reason_phrase_.empty()) {
            r.reason_phrase_ = std::string(http::model::standard_reason_phrase(code));
        }
        r.headers_ = std::move(last_response_headers_);
        read_timing(r.timing_);
        return r;
    }

    void CurlEasy::read_timing(http::model::Timing& timing) {
        auto read = [this](CURLINFO info) -> curl_off_t {
            curl_off_t value = 0;
            if (curl_easy_getinfo(handle_, info, &value) != CURLE_OK) {
                return 0;
            }
            return value;
        };

        const curl_off_t name_lookup = read(CURLINFO_NAMELOOKUP_TIME_T);
        const curl_off_t connect = read(CURLINFO_CONNECT_TIME_T);
        const curl_off_t app_connect = read(CURLINFO_APPCONNECT_TIME_T);
        const curl_off_t pre_transfer = read(CURLINFO_PRETRANSFER_TIME_T);
        const curl_off_t start_transfer = read(CURLINFO_STARTTRANSFER_TIME_T);
        const curl_off_t total = read(CURLINFO_TOTAL_TIME_T);

        auto span = [](curl_off_t from, curl_off_t to) { return microseconds{to > from ? to - from : 0}; };

        timing.dns_resolution_ = microseconds{name_lookup};
        timing.connection_ = span(name_lookup, connect);
        timing.tls_handshake_ = app_connect > 0 ? span(connect, app_connect) : microseconds{0};
        timing.time_to_first_byte_ = span(pre_transfer, start_transfer);
        timing.content_download_ = span(start_transfer, total);
        timing.total_ = microseconds{total};
    }

}  // namespace http::client
