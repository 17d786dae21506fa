#ifndef CATFLEET_CURL_GLOBAL_HPP
#define CATFLEET_CURL_GLOBAL_HPP

#include <string>

namespace catfleet::http::client {

    // Process-wide libcurl setup. Construct once in main before any session exists.
    // Throws if the linked libcurl cannot speak HTTP/2 over TLS.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;

        [[nodiscard]] const std::string& version() const { return version_; }

       private:
        std::string version_;
    };

}  // namespace catfleet::http::client

#endif
