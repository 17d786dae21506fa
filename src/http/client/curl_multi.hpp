#ifndef CATFLEET_CURL_MULTI_HPP
#define CATFLEET_CURL_MULTI_HPP

#include <curl/curl.h>

#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "../model/model.hpp"

namespace catfleet::http::client {
    // One easy handle and the buffers libcurl writes into for it.
    struct CurlTransfer {
        CURL* easy_{};
        curl_slist* headers_{};
        std::string request_body_;
        std::string response_body_;
        http::model::Headers response_headers_;
        std::array<char, CURL_ERROR_SIZE> error_buf_{};

        // Throws http_error::TransportError if libcurl cannot allocate a handle.
        CurlTransfer();

        ~CurlTransfer();
        CurlTransfer(const CurlTransfer&) = delete;
        CurlTransfer& operator=(const CurlTransfer&) = delete;
        CurlTransfer(CurlTransfer&&) = delete;
        CurlTransfer& operator=(CurlTransfer&&) = delete;

        // Text from the error buffer, or libcurl's generic message for `code`.
        [[nodiscard]] std::string failure_reason(CURLcode code) const;
    };

    struct TransferOutcome {
        CURLcode code_ = CURLE_OK;
        // The driver stopped before the transfer finished.
        bool aborted_ = false;
    };

    /// A libcurl multi handle capped at one multiplexed connection, driven by a background thread.
    ///
    /// Callers hand in configured transfers and block until each completes. Once stopped, or once
    /// the driver fails, every waiting and later caller gets an aborted outcome.
    class CurlMulti {
       public:
        // Throws http_error::TransportError if the multi handle cannot be set up.
        explicit CurlMulti(std::uint64_t id);

        ~CurlMulti();
        CurlMulti(const CurlMulti&) = delete;
        CurlMulti& operator=(const CurlMulti&) = delete;
        CurlMulti(CurlMulti&&) = delete;
        CurlMulti& operator=(CurlMulti&&) = delete;

        TransferOutcome run(const std::shared_ptr<CurlTransfer>& transfer);

        // Stops the driver and releases every waiting caller. Safe to call more than once.
        void stop();

        [[nodiscard]] bool stopped() const { return stopped_.load(); }

       private:
        struct Pending {
            std::shared_ptr<CurlTransfer> transfer_;
            std::promise<TransferOutcome> done_;
        };

        void drive();
        void adopt_pending();
        void collect_finished();
        void abort_all();

        const std::uint64_t id_;
        std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)> multi_{nullptr, &curl_multi_cleanup};

        std::mutex mutex_;
        std::deque<std::shared_ptr<Pending>> pending_;
        bool accepting_ = true;

        // Touched by the driver thread only.
        std::unordered_map<CURL*, std::shared_ptr<Pending>> in_flight_;

        std::atomic<bool> stop_ = false;
        std::atomic<bool> stopped_ = false;
        std::mutex stop_mutex_;
        std::thread driver_;
    };
}  // namespace catfleet::http::client

#endif
