#include "curl_global.hpp"

#include <curl/curl.h>

#include <stdexcept>
#include <string>

#include "../../utils/logging.hpp"

namespace http::client {

    CurlGlobal::CurlGlobal() {
        const auto rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("Failed to initialize libcurl: ") + curl_easy_strerror(rc));
        }

        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        logging::get_logger()->debug("libcurl {} ({})", info->version, info->ssl_version != nullptr ? info->ssl_version : "no TLS");
    }

    CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

}  // namespace http::client
