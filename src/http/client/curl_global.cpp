#include "curl_global.hpp"

#include <curl/curl.h>

#include <stdexcept>
#include <string>

#include "../error/http_error.hpp"

namespace catfleet::http::client {

    CurlGlobal::CurlGlobal() {
        const auto rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("Failed to initialize libcurl: ") + curl_easy_strerror(rc));
        }

        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        if (info == nullptr || (info->features & CURL_VERSION_HTTP2) == 0 || (info->features & CURL_VERSION_SSL) == 0) {
            curl_global_cleanup();
            throw http::http_error::ConfigError("libcurl was built without HTTP/2 or TLS support");
        }

        version_ = std::string(info->version) + " (" + (info->ssl_version != nullptr ? info->ssl_version : "unknown TLS") + ")";
    }

    CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

}  // namespace catfleet::http::client
