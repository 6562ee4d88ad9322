#ifndef COURIER_CURL_SHARE_HPP
#define COURIER_CURL_SHARE_HPP

#include <curl/curl.h>

#include <array>
#include <mutex>

namespace http::client {
    // The connection cache is left out: libcurl does not support sharing it between threads
    inline constexpr std::array<curl_lock_data, 2> SHARED_DATA = {CURL_LOCK_DATA_DNS, CURL_LOCK_DATA_SSL_SESSION};

    // DNS cache and TLS session cache shared by every CurlEasy that is handed this object. Each
    // shared data kind has its own lock so handles on different threads can use it at once.
    class CurlShare {
       public:
        CurlShare();

        ~CurlShare();
        CurlShare(const CurlShare&) = delete;
        CurlShare& operator=(const CurlShare&) = delete;
        CurlShare(CurlShare&&) = delete;
        CurlShare& operator=(CurlShare&&) = delete;

        [[nodiscard]] CURLSH* handle() const { return handle_; }

       private:
        template <typename T>
        void setopt(int option, T value);

        static void lock_cb(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
        static void unlock_cb(CURL* handle, curl_lock_data data, void* userptr);

        std::array<std::mutex, CURL_LOCK_DATA_LAST> mutexes_;
        CURLSH* handle_{};
    };

}  // namespace http::client

#endif
