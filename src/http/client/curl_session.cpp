#include "curl_session.hpp"

#include <curl/curl.h>
#include <netdb.h>
#include <sys/socket.h>

#include <array>
#include <memory>
#include <stdexcept>
#include <string>

#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"

namespace catfleet::http::client {

    struct CurlDefaults {
        static constexpr long HTTP_VERSION = CURL_HTTP_VERSION_2TLS;
        static constexpr long PIPE_WAIT = 1L;
        static constexpr long FOLLOW_LOCATION = 0L;
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long TCP_KEEPALIVE = 1L;
        static constexpr long TCP_KEEPIDLE = 120L;
        static constexpr long TCP_KEEPINTVL = 60L;
        static constexpr long VERIFY_PEER = 1L;
        static constexpr long VERIFY_HOST = 2L;
        static constexpr const char* ACCEPT_ENCODING = "";
    };

    namespace {
        std::atomic<std::uint64_t> next_session_id{1};

        std::shared_ptr<spdlog::logger> session_log() {
            static auto logger = logging::category_logger("catfleet.session");
            return logger;
        }

        template <typename T>
        void setopt(CURL* handle, CURLoption option, T value) {
            const auto rc = curl_easy_setopt(handle, option, value);

            if (rc != CURLE_OK) {
                throw http::http_error::TransportError(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
            }
        }

        size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
            auto* transfer = static_cast<CurlTransfer*>(userdata);
            const size_t bytes = size * n_items;

            const std::string line = string_utils::trim(std::string(buffer, bytes));
            if (line.empty()) {
                return bytes;
            }

            // A new status line starts a new header block (informational responses come first).
            if (string_utils::ieq_prefix(line.c_str(), line.size(), "HTTP/")) {
                transfer->response_headers_.clear();
                return bytes;
            }

            const auto colon = line.find(':');
            if (colon != std::string::npos) {
                transfer->response_headers_.push_back(http::model::Header{
                    .name_ = string_utils::trim(line.substr(0, colon)),
                    .value_ = string_utils::trim(line.substr(colon + 1)),
                });
            }

            return bytes;
        }

        bool method_carries_body(const std::string& method) { return method == "POST" || method == "PUT" || method == "PATCH"; }
    }  // namespace

    TransferFailure classify_curl_result(CURLcode code) {
        switch (code) {
            case CURLE_OK:
                return TransferFailure::NONE;
            // RST_STREAM on this request only; the connection stays up.
            case CURLE_HTTP2_STREAM:
                return TransferFailure::STREAM_CANCELED;
            case CURLE_HTTP2:
            case CURLE_SEND_ERROR:
            case CURLE_RECV_ERROR:
            case CURLE_GOT_NOTHING:
            case CURLE_PARTIAL_FILE:
            case CURLE_COULDNT_CONNECT:
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_SSL_CONNECT_ERROR:
                return TransferFailure::TRANSPORT_CLOSED;
            default:
                return TransferFailure::TERMINAL;
        }
    }

    CurlSession::CurlSession(const http::model::Url& origin, const CurlSessionOptions& options)
        : id_(next_session_id.fetch_add(1)), origin_(origin), options_(options), port_(constants::HTTPS_DEFAULT_PORT) {
        if (!origin_.is_absolute() || origin_.scheme_ != constants::HTTPS_SCHEME) {
            throw http::http_error::ConfigError("origin must be an absolute https url: '" + origin_.to_string() + "'");
        }

        host_ = origin_.host();
        if (host_.empty()) {
            throw http::http_error::ConfigError("origin has no host: '" + origin_.to_string() + "'");
        }

        try {
            port_ = origin_.port_or(constants::HTTPS_DEFAULT_PORT);
        } catch (const std::invalid_argument& e) {
            throw http::http_error::ConfigError(e.what());
        }

        resolve();
        multi_ = std::make_unique<CurlMulti>(id_);
        handshake();

        session_log()->debug("session {} to {}:{} ready", id_, host_, port_);
    }

    CurlSession::~CurlSession() {
        // Stops the driver first; pending callers see the session as closed.
        multi_.reset();
        session_log()->debug("session {} released", id_);
    }

    void CurlSession::resolve() {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        const std::string service = std::to_string(port_);
        addrinfo* result = nullptr;
        const int rc = getaddrinfo(host_.c_str(), service.c_str(), &hints, &result);
        if (rc != 0 || result == nullptr) {
            throw http::http_error::TransportError("failed to resolve '" + host_ + "': " + (rc != 0 ? gai_strerror(rc) : "no addresses"), origin_.to_string());
        }
        const std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> addresses(result, &freeaddrinfo);

        std::array<char, NI_MAXHOST> address{};
        if (getnameinfo(result->ai_addr, result->ai_addrlen, address.data(), address.size(), nullptr, 0, NI_NUMERICHOST) != 0) {
            throw http::http_error::TransportError("failed to format resolved address for '" + host_ + "'", origin_.to_string());
        }

        session_log()->debug("resolved {} to {}", host_, address.data());

        // IPv6 literals need no pinning.
        if (host_.find(':') != std::string::npos) {
            return;
        }

        // Pin the address so every transfer of this session reaches the same peer.
        std::string pinned = address.data();
        if (result->ai_family == AF_INET6) {
            pinned = "[" + pinned + "]";
        }

        const std::string entry = host_ + ":" + service + ":" + pinned;
        resolve_list_.reset(curl_slist_append(nullptr, entry.c_str()));
        if (resolve_list_ == nullptr) {
            throw http::http_error::TransportError("Failed to build CURL resolve list");
        }
    }

    void CurlSession::handshake() {
        http::model::Request warm_up;
        warm_up.method_ = "HEAD";
        warm_up.url_ = origin_.scheme_ + "://" + origin_.authority_ + "/";

        // Opens the connection every later request is multiplexed onto.
        auto transfer = make_transfer(warm_up);
        const TransferOutcome outcome = multi_->run(transfer);

        if (outcome.aborted_ || outcome.code_ != CURLE_OK) {
            throw http::http_error::TransportError("handshake with " + warm_up.url_ + " failed: " + transfer->failure_reason(outcome.code_), warm_up.url_);
        }

        long version = 0;
        curl_easy_getinfo(transfer->easy_, CURLINFO_HTTP_VERSION, &version);
        if (version != CURL_HTTP_VERSION_2_0) {
            throw http::http_error::TransportError(warm_up.url_ + " did not negotiate HTTP/2", warm_up.url_);
        }

        session_log()->trace("HTTP/2 connection to {} established", warm_up.url_);
    }

    SessionState CurlSession::poll_ready() {
        return closed_.load() || multi_->stopped() ? SessionState::CLOSED : SessionState::READY;
    }

    http::model::Response CurlSession::send(const http::model::Request& req) {
        if (poll_ready() == SessionState::CLOSED) {
            throw http::http_error::TransportClosed("session " + std::to_string(id_) + " is closed", req.url_);
        }

        auto transfer = make_transfer(req);
        const TransferOutcome outcome = multi_->run(transfer);
        return finish(*transfer, outcome, req.url_);
    }

    std::shared_ptr<CurlTransfer> CurlSession::make_transfer(const http::model::Request& req) const {
        const auto target = http::model::Url::parse(req.url_);
        if (target.scheme_ != origin_.scheme_ || target.authority_ != origin_.authority_) {
            throw http::http_error::TransportError("request for '" + req.url_ + "' does not target session origin " + origin_.to_string(), req.url_);
        }

        auto transfer = std::make_shared<CurlTransfer>();
        CURL* handle = transfer->easy_;

        setopt(handle, CURLOPT_ERRORBUFFER, transfer->error_buf_.data());
        setopt(handle, CURLOPT_URL, req.url_.c_str());
        setopt(handle, CURLOPT_HTTP_VERSION, CurlDefaults::HTTP_VERSION);
        setopt(handle, CURLOPT_PIPEWAIT, CurlDefaults::PIPE_WAIT);
        setopt(handle, CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout_.count()));
        setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.request_timeout_.count()));
        setopt(handle, CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(handle, CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);
        setopt(handle, CURLOPT_TCP_KEEPALIVE, CurlDefaults::TCP_KEEPALIVE);
        setopt(handle, CURLOPT_TCP_KEEPIDLE, CurlDefaults::TCP_KEEPIDLE);
        setopt(handle, CURLOPT_TCP_KEEPINTVL, CurlDefaults::TCP_KEEPINTVL);
        // Empty string => accept all supported encodings (gzip/deflate/br)
        setopt(handle, CURLOPT_ACCEPT_ENCODING, CurlDefaults::ACCEPT_ENCODING);
        setopt(handle, CURLOPT_SSL_VERIFYPEER, CurlDefaults::VERIFY_PEER);
        setopt(handle, CURLOPT_SSL_VERIFYHOST, CurlDefaults::VERIFY_HOST);
        if (resolve_list_ != nullptr) {
            setopt(handle, CURLOPT_RESOLVE, resolve_list_.get());
        }
        if (!options_.ca_file_.empty()) {
            setopt(handle, CURLOPT_CAINFO, options_.ca_file_.c_str());
        }

        if (req.method_ == "GET") {
            setopt(handle, CURLOPT_HTTPGET, 1L);
        } else if (req.method_ == "HEAD") {
            setopt(handle, CURLOPT_NOBODY, 1L);
        } else {
            if (req.method_ == "POST") {
                setopt(handle, CURLOPT_POST, 1L);
            } else {
                setopt(handle, CURLOPT_CUSTOMREQUEST, req.method_.c_str());
            }

            if (!req.body_.empty() || method_carries_body(req.method_)) {
                transfer->request_body_ = req.body_;
                setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(transfer->request_body_.size()));
                setopt(handle, CURLOPT_POSTFIELDS, transfer->request_body_.data());
            }
        }

        for (const auto& header : req.headers_) {
            // "Name;" is how libcurl sends a header with an empty value.
            const std::string line = header.value_.empty() ? header.name_ + ";" : header.name_ + ": " + header.value_;
            curl_slist* next = curl_slist_append(transfer->headers_, line.c_str());
            if (next == nullptr) {
                throw http::http_error::TransportError("Failed to build request headers", req.url_);
            }
            transfer->headers_ = next;
        }
        if (transfer->headers_ != nullptr) {
            setopt(handle, CURLOPT_HTTPHEADER, transfer->headers_);
        }

        setopt(handle, CURLOPT_WRITEFUNCTION, &string_utils::write_to_string);
        setopt(handle, CURLOPT_WRITEDATA, &transfer->response_body_);
        setopt(handle, CURLOPT_HEADERFUNCTION, &header_cb);
        setopt(handle, CURLOPT_HEADERDATA, transfer.get());

        return transfer;
    }

    http::model::Response CurlSession::finish(CurlTransfer& transfer, const TransferOutcome& outcome, const std::string& url) {
        if (outcome.aborted_) {
            closed_ = true;
            throw http::http_error::TransportClosed("session " + std::to_string(id_) + " stopped before the request completed", url);
        }

        const std::string reason = transfer.failure_reason(outcome.code_);

        switch (classify_curl_result(outcome.code_)) {
            case TransferFailure::NONE:
                break;
            case TransferFailure::STREAM_CANCELED:
                throw http::http_error::StreamCanceled("stream canceled: " + reason, url);
            case TransferFailure::TRANSPORT_CLOSED:
                closed_ = true;
                throw http::http_error::TransportClosed("transport closed: " + reason, url);
            case TransferFailure::TERMINAL:
                throw http::http_error::TransportError("request failed: " + reason, url);
        }

        long code = 0;
        long version = 0;
        char* eff = nullptr;
        curl_easy_getinfo(transfer.easy_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(transfer.easy_, CURLINFO_HTTP_VERSION, &version);
        curl_easy_getinfo(transfer.easy_, CURLINFO_EFFECTIVE_URL, &eff);

        if (version != CURL_HTTP_VERSION_2_0) {
            throw http::http_error::TransportError("server did not negotiate HTTP/2", url);
        }

        http::model::Response r;
        r.status_ = code;
        r.headers_ = std::move(transfer.response_headers_);
        r.body_ = std::move(transfer.response_body_);
        r.effective_url_ = eff != nullptr ? eff : url;
        r.version_ = http::model::HttpVersion::HTTP_2;
        return r;
    }

    CurlSessionFactory::CurlSessionFactory(http::model::Url origin, CurlSessionOptions options) : origin_(std::move(origin)), options_(std::move(options)) {}

    std::unique_ptr<ISession> CurlSessionFactory::connect() { return std::make_unique<CurlSession>(origin_, options_); }
}  // namespace catfleet::http::client
