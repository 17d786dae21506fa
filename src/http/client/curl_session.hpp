#ifndef CATFLEET_CURL_SESSION_HPP
#define CATFLEET_CURL_SESSION_HPP

#include <curl/curl.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "../../utils/constants.hpp"
#include "../model/model.hpp"
#include "../model/url.hpp"
#include "curl_multi.hpp"
#include "session.hpp"

namespace catfleet::http::client {
    struct CurlSessionOptions {
        std::chrono::milliseconds connect_timeout_ = constants::CONNECT_TIMEOUT;
        std::chrono::milliseconds request_timeout_ = constants::REQUEST_TIMEOUT;
        // Empty uses the system trust store.
        std::string ca_file_;
    };

    enum class TransferFailure {
        NONE,
        STREAM_CANCELED,
        TRANSPORT_CLOSED,
        TERMINAL,
    };

    [[nodiscard]] TransferFailure classify_curl_result(CURLcode code);

    /// One HTTP/2 connection to a fixed origin.
    ///
    /// Construction resolves the origin, opens the connection through the session's own multi
    /// handle with a HEAD request and requires that ALPN settled on h2. Later requests are
    /// multiplexed onto that connection. When the driver stops, the session reports closed.
    class CurlSession : public ISession {
       public:
        // Throws http_error::ConfigError for a non-https origin and http_error::TransportError
        // for DNS, TCP or TLS failures, or when the origin does not speak HTTP/2.
        CurlSession(const http::model::Url& origin, const CurlSessionOptions& options);

        ~CurlSession() override;
        CurlSession(const CurlSession&) = delete;
        CurlSession& operator=(const CurlSession&) = delete;
        CurlSession(CurlSession&&) = delete;
        CurlSession& operator=(CurlSession&&) = delete;

        [[nodiscard]] SessionState poll_ready() override;
        http::model::Response send(const http::model::Request& req) override;
        [[nodiscard]] std::uint64_t id() const override { return id_; }

       private:
        void resolve();
        void handshake();
        [[nodiscard]] std::shared_ptr<CurlTransfer> make_transfer(const http::model::Request& req) const;
        http::model::Response finish(CurlTransfer& transfer, const TransferOutcome& outcome, const std::string& url);

        const std::uint64_t id_;
        const http::model::Url origin_;
        const CurlSessionOptions options_;
        std::string host_;
        std::uint16_t port_;

        std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> resolve_list_{nullptr, &curl_slist_free_all};
        std::unique_ptr<CurlMulti> multi_;
        std::atomic<bool> closed_ = false;
    };

    class CurlSessionFactory : public ISessionFactory {
       public:
        CurlSessionFactory(http::model::Url origin, CurlSessionOptions options);

        std::unique_ptr<ISession> connect() override;

       private:
        http::model::Url origin_;
        CurlSessionOptions options_;
    };
}  // namespace catfleet::http::client

#endif
