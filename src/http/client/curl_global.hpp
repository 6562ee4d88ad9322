#ifndef COURIER_CURL_GLOBAL_HPP
#define COURIER_CURL_GLOBAL_HPP

namespace http::client {

    // libcurl process-wide init/cleanup. Create exactly one, before any CurlEasy or CurlShare,
    // and keep it alive until they are all gone.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;
    };

}  // namespace http::client

#endif
