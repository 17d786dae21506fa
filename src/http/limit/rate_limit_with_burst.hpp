#ifndef CATFLEET_RATE_LIMIT_WITH_BURST_HPP
#define CATFLEET_RATE_LIMIT_WITH_BURST_HPP

#include <cstdint>
#include <memory>

#include "../../utils/clock.hpp"
#include "../client/interface.hpp"
#include "rate.hpp"

namespace catfleet::http::limit {
    /// Enforces a rate limit on the inner service. A default pool and a burst pool refill on
    /// their own periods, and both land in one shared pool capped at default + burst.
    class RateLimitWithBurst : public http::client::IService {
       public:
        // Throws http_error::ConfigError when the two counts do not fit one pool.
        RateLimitWithBurst(std::unique_ptr<http::client::IService> inner, Rate rate_default, Rate rate_burst, std::shared_ptr<utils::IClock> clock);

        [[nodiscard]] http::client::Readiness poll_ready() override;

        // Throws std::logic_error unless the previous poll_ready reported ready.
        http::model::Response call(http::model::Request req) override;

        [[nodiscard]] std::uint64_t remaining() const { return remaining_; }
        [[nodiscard]] bool is_limited() const { return state_ == State::LIMITED; }
        [[nodiscard]] std::uint64_t ceiling() const { return rate_default_.count() + rate_burst_.count(); }

       private:
        enum class State {
            READY,
            LIMITED,
        };

        void refill(utils::IClock::time_point now);
        void add_tokens(std::uint64_t count);

        std::unique_ptr<http::client::IService> inner_;
        std::shared_ptr<utils::IClock> clock_;
        Rate rate_default_;
        Rate rate_burst_;

        State state_ = State::READY;
        bool observed_ready_ = false;
        utils::IClock::time_point until_default_;
        utils::IClock::time_point until_burst_;
        utils::IClock::time_point wake_;
        std::uint64_t remaining_ = 0;
    };
}  // namespace catfleet::http::limit

#endif
