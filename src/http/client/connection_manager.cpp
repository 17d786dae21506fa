#include "connection_manager.hpp"

#include <algorithm>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

#include "../../utils/logging.hpp"
#include "../error/http_error.hpp"
#include "../middleware/extra_headers.hpp"

namespace catfleet::http::client {
    namespace {
        constexpr const char* USER_AGENT = "user-agent";

        std::shared_ptr<spdlog::logger> connection_log() {
            static auto logger = logging::category_logger("catfleet.connection");
            return logger;
        }
    }  // namespace

    ConnectionManager::ConnectionManager(std::unique_ptr<ISessionFactory> factory, std::string user_agent, std::shared_ptr<utils::IClock> clock,
                                         RetryPolicy retry_policy)
        : factory_(std::move(factory)), user_agent_(std::move(user_agent)), clock_(std::move(clock)), retry_policy_(retry_policy) {
        if (factory_ == nullptr) {
            throw std::invalid_argument("ConnectionManager requires a session factory");
        }
        if (clock_ == nullptr) {
            throw std::invalid_argument("ConnectionManager requires a clock");
        }

        session_ = factory_->connect();
        connection_log()->debug("session {} established", session_->id());
    }

    http::model::Response ConnectionManager::call(http::model::Request req) {
        req.version_ = http::model::HttpVersion::HTTP_2;
        middleware::set_header_once(req.headers_, USER_AGENT, user_agent_, "ConnectionManager");

        std::size_t reconnects = 0;
        std::size_t stream_retries = 0;
        std::chrono::milliseconds delay = retry_policy_.base_delay_;

        for (;;) {
            if (session_ == nullptr || session_->poll_ready() == SessionState::CLOSED) {
                reconnect(reconnects, delay);
                continue;
            }

            for (;;) {
                try {
                    connection_log()->trace("sending {} {} on session {}", req.method_, req.url_, session_->id());
                    return session_->send(req);
                } catch (const http::http_error::StreamCanceled& e) {
                    ++stream_retries;
                    ++stream_retry_count_;

                    if (retry_policy_.max_stream_retries_ != 0 && stream_retries > retry_policy_.max_stream_retries_) {
                        throw http::http_error::TransportError("stream canceled " + std::to_string(stream_retries) + " times; giving up: " + e.what(),
                                                               req.url_);
                    }

                    connection_log()->debug("stream canceled on session {}; retrying: {}", session_->id(), e.what());
                    backoff(delay);
                } catch (const http::http_error::TransportClosed& e) {
                    connection_log()->info("session {} closed: {}", session_->id(), e.what());
                    reconnect(reconnects, delay);
                    break;
                }
            }
        }
    }

    void ConnectionManager::reconnect(std::size_t& attempts, std::chrono::milliseconds& delay) {
        if (retry_policy_.max_reconnects_ != 0 && attempts >= retry_policy_.max_reconnects_) {
            throw http::http_error::TransportError("transport closed after " + std::to_string(attempts) + " reconnects; giving up");
        }

        backoff(delay);

        ++attempts;
        ++reconnect_count_;

        // The old session must be gone before the next one exists.
        session_.reset();
        session_ = factory_->connect();

        connection_log()->info("reconnected; session {} is current", session_->id());
    }

    void ConnectionManager::backoff(std::chrono::milliseconds& delay) {
        if (retry_policy_.base_delay_ <= std::chrono::milliseconds::zero()) {
            return;
        }

        std::minstd_rand rng{std::random_device{}()};
        std::uniform_int_distribution<long> jitter(0, static_cast<long>(retry_policy_.base_delay_.count()));

        clock_->sleep_until(clock_->now() + delay + std::chrono::milliseconds{jitter(rng)});
        delay = std::min(delay * 2, std::max(retry_policy_.max_delay_, retry_policy_.base_delay_));
    }
}  // namespace catfleet::http::client
