#include "rate_limit_with_burst.hpp"

#include <algorithm>
#include <limits>
#include <memory>
#include <stdexcept>

#include "../../utils/logging.hpp"
#include "../error/http_error.hpp"

namespace catfleet::http::limit {
    namespace {
        std::shared_ptr<spdlog::logger> limit_log() {
            static auto logger = logging::category_logger("catfleet.limit");
            return logger;
        }
    }  // namespace

    RateLimitWithBurst::RateLimitWithBurst(std::unique_ptr<http::client::IService> inner, Rate rate_default, Rate rate_burst,
                                           std::shared_ptr<utils::IClock> clock)
        : inner_(std::move(inner)), clock_(std::move(clock)), rate_default_(rate_default), rate_burst_(rate_burst) {
        if (inner_ == nullptr) {
            throw std::invalid_argument("RateLimitWithBurst requires an inner service");
        }
        if (clock_ == nullptr) {
            throw std::invalid_argument("RateLimitWithBurst requires a clock");
        }
        if (rate_default_.count() > std::numeric_limits<std::uint64_t>::max() - rate_burst_.count()) {
            throw http::http_error::ConfigError("default and burst rate counts overflow the shared pool");
        }

        until_default_ = clock_->now();
        until_burst_ = until_default_;
        wake_ = until_default_;
        // Both pools start full.
        remaining_ = ceiling();
    }

    void RateLimitWithBurst::refill(utils::IClock::time_point now) {
        if (now >= until_default_) {
            until_default_ = now + rate_default_.period();
            add_tokens(rate_default_.count());
        }

        if (now >= until_burst_) {
            until_burst_ = now + rate_burst_.period();
            add_tokens(rate_burst_.count());
        }
    }

    void RateLimitWithBurst::add_tokens(std::uint64_t count) { remaining_ = count >= ceiling() - remaining_ ? ceiling() : remaining_ + count; }

    http::client::Readiness RateLimitWithBurst::poll_ready() {
        observed_ready_ = false;

        if (state_ == State::LIMITED) {
            const auto now = clock_->now();

            if (now < wake_) {
                limit_log()->trace("rate limit exceeded; sleeping");
                return http::client::Readiness::until(wake_);
            }

            // At least one pool is due.
            refill(now);
            state_ = State::READY;
        }

        http::client::Readiness inner = inner_->poll_ready();
        observed_ready_ = inner.ready_;
        return inner;
    }

    http::model::Response RateLimitWithBurst::call(http::model::Request req) {
        if (state_ != State::READY || !observed_ready_) {
            throw std::logic_error("service not ready; poll_ready must report ready before call");
        }
        observed_ready_ = false;

        // Time may have moved on since poll_ready.
        refill(clock_->now());

        if (remaining_ == 0) {
            throw std::logic_error("rate limiter in ready state with an empty pool");
        }

        --remaining_;

        if (remaining_ == 0) {
            // Last token spent; nothing more until the earlier of the two refills.
            wake_ = std::min(until_default_, until_burst_);
            state_ = State::LIMITED;
            limit_log()->debug("rate limit pool exhausted; next refill in {}ms",
                               std::chrono::duration_cast<std::chrono::milliseconds>(wake_ - clock_->now()).count());
        }

        return inner_->call(std::move(req));
    }
}  // namespace catfleet::http::limit
