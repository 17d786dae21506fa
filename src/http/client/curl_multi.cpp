#include "curl_multi.hpp"

#include <memory>
#include <string>

#include "../../utils/logging.hpp"
#include "../error/http_error.hpp"

namespace catfleet::http::client {
    namespace {
        constexpr long MAX_CONNECTIONS = 1L;
        constexpr int DRIVER_POLL_TIMEOUT_MS = 1000;

        std::shared_ptr<spdlog::logger> session_log() {
            static auto logger = logging::category_logger("catfleet.session");
            return logger;
        }

        void multi_setopt(CURLM* handle, CURLMoption option, long value) {
            const auto rc = curl_multi_setopt(handle, option, value);

            if (rc != CURLM_OK) {
                throw http::http_error::TransportError(std::string("curl_multi_setopt failed: ") + curl_multi_strerror(rc));
            }
        }

        TransferOutcome aborted() { return TransferOutcome{.code_ = CURLE_ABORTED_BY_CALLBACK, .aborted_ = true}; }
    }  // namespace

    CurlTransfer::CurlTransfer() : easy_(curl_easy_init()) {
        if (easy_ == nullptr) {
            throw http::http_error::TransportError("Failed to create CURL easy handle");
        }
    }

    CurlTransfer::~CurlTransfer() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (easy_ != nullptr) {
            curl_easy_cleanup(easy_);
        }
    }

    std::string CurlTransfer::failure_reason(CURLcode code) const {
        return error_buf_[0] != '\0' ? std::string(error_buf_.data()) : std::string(curl_easy_strerror(code));
    }

    CurlMulti::CurlMulti(std::uint64_t id) : id_(id) {
        multi_.reset(curl_multi_init());
        if (multi_ == nullptr) {
            throw http::http_error::TransportError("Failed to create CURL multi handle");
        }

        // One connection, every request multiplexed onto it.
        multi_setopt(multi_.get(), CURLMOPT_PIPELINING, CURLPIPE_MULTIPLEX);
        multi_setopt(multi_.get(), CURLMOPT_MAX_HOST_CONNECTIONS, MAX_CONNECTIONS);
        multi_setopt(multi_.get(), CURLMOPT_MAX_TOTAL_CONNECTIONS, MAX_CONNECTIONS);

        driver_ = std::thread([this] { drive(); });
    }

    CurlMulti::~CurlMulti() { stop(); }

    void CurlMulti::stop() {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_ = true;

        if (driver_.joinable()) {
            curl_multi_wakeup(multi_.get());
            driver_.join();
        }
    }

    TransferOutcome CurlMulti::run(const std::shared_ptr<CurlTransfer>& transfer) {
        auto pending = std::make_shared<Pending>();
        pending->transfer_ = transfer;
        auto completion = pending->done_.get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!accepting_) {
                return aborted();
            }
            pending_.push_back(pending);
        }

        curl_multi_wakeup(multi_.get());
        return completion.get();
    }

    void CurlMulti::drive() {
        try {
            while (!stop_.load()) {
                adopt_pending();

                int running = 0;
                CURLMcode mc = curl_multi_perform(multi_.get(), &running);
                if (mc != CURLM_OK) {
                    throw http::http_error::TransportClosed(std::string("curl_multi_perform failed: ") + curl_multi_strerror(mc));
                }

                collect_finished();

                mc = curl_multi_poll(multi_.get(), nullptr, 0, DRIVER_POLL_TIMEOUT_MS, nullptr);
                if (mc != CURLM_OK) {
                    throw http::http_error::TransportClosed(std::string("curl_multi_poll failed: ") + curl_multi_strerror(mc));
                }
            }
        } catch (const std::exception& e) {
            session_log()->error("session {} connection error: {}", id_, e.what());
        }

        abort_all();
    }

    void CurlMulti::adopt_pending() {
        std::deque<std::shared_ptr<Pending>> incoming;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            incoming.swap(pending_);
        }

        for (auto& pending : incoming) {
            CURL* easy = pending->transfer_->easy_;
            const auto mc = curl_multi_add_handle(multi_.get(), easy);
            if (mc != CURLM_OK) {
                session_log()->warn("session {} could not start transfer: {}", id_, curl_multi_strerror(mc));
                pending->done_.set_value(TransferOutcome{.code_ = CURLE_FAILED_INIT});
                continue;
            }
            in_flight_.emplace(easy, std::move(pending));
        }
    }

    void CurlMulti::collect_finished() {
        int msgs_left = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &msgs_left)) {
            if (msg->msg != CURLMSG_DONE) {
                continue;
            }

            CURL* easy = msg->easy_handle;
            const CURLcode code = msg->data.result;
            curl_multi_remove_handle(multi_.get(), easy);

            auto it = in_flight_.find(easy);
            if (it == in_flight_.end()) {
                continue;
            }

            auto pending = std::move(it->second);
            in_flight_.erase(it);
            pending->done_.set_value(TransferOutcome{.code_ = code});
        }
    }

    void CurlMulti::abort_all() {
        stopped_ = true;

        std::deque<std::shared_ptr<Pending>> never_started;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            accepting_ = false;
            never_started.swap(pending_);
        }

        for (auto& [easy, pending] : in_flight_) {
            curl_multi_remove_handle(multi_.get(), easy);
            pending->done_.set_value(aborted());
        }
        in_flight_.clear();

        for (auto& pending : never_started) {
            pending->done_.set_value(aborted());
        }
    }
}  // namespace catfleet::http::client
