#include <catch2/catch.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>

#include "http/error/http_error.hpp"
#include "http/limit/rate.hpp"
#include "http/limit/rate_limit_with_burst.hpp"
#include "test_helpers.hpp"
#include "utils/constants.hpp"

using namespace catfleet;
using namespace std::chrono_literals;

namespace {
    struct LimiterFixture {
        std::shared_ptr<testing::ManualClock> clock = std::make_shared<testing::ManualClock>();
        std::shared_ptr<testing::RecordingService::Log> log = std::make_shared<testing::RecordingService::Log>();
        http::limit::RateLimitWithBurst limiter;

        LimiterFixture(http::limit::Rate def, http::limit::Rate burst)
            : limiter(std::make_unique<testing::RecordingService>(log), def, burst, clock) {}

        // Number of calls admitted before the limiter reports not ready.
        std::size_t drain() {
            std::size_t admitted = 0;
            while (limiter.poll_ready().ready_) {
                limiter.call(testing::get("https://host/"));
                ++admitted;
            }
            return admitted;
        }
    };
}  // namespace

TEST_CASE("Rate rejects zero count and zero period", "[limit][rate]") {
    REQUIRE_THROWS_AS(http::limit::Rate(0, 100ms), http::http_error::ConfigError);
    REQUIRE_THROWS_AS(http::limit::Rate(1, 0ms), http::http_error::ConfigError);
    REQUIRE_NOTHROW(http::limit::Rate(1, 1ms));
}

TEST_CASE("Fresh limiter admits default plus burst calls", "[limit]") {
    auto [def, burst] = GENERATE(table<std::uint64_t, std::uint64_t>({{1, 1}, {2, 30}, {5, 1}, {1, 7}}));

    LimiterFixture f(http::limit::Rate(def, 1s), http::limit::Rate(burst, 60s));

    REQUIRE(f.drain() == def + burst);
    REQUIRE(f.limiter.is_limited());
    REQUIRE(f.limiter.remaining() == 0);
    REQUIRE(f.log->requests_.size() == def + burst);
}

TEST_CASE("Limiter follows the default and burst refill timeline", "[limit]") {
    LimiterFixture f(http::limit::Rate(1, 100ms), http::limit::Rate(2, 400ms));

    SECTION("three calls at start, then blocked until the default refill") {
        REQUIRE(f.drain() == 3);

        const auto readiness = f.limiter.poll_ready();
        REQUIRE_FALSE(readiness.ready_);
        REQUIRE(readiness.wake_at_.has_value());
        REQUIRE(*readiness.wake_at_ == f.clock->now() + 100ms);
    }

    SECTION("one call after the default refill, three after both refill") {
        REQUIRE(f.drain() == 3);

        f.clock->advance(101ms);
        REQUIRE(f.drain() == 1);

        f.clock->advance(301ms);
        REQUIRE(f.drain() == 3);
        REQUIRE(f.log->requests_.size() == 7);
    }
}

TEST_CASE("Refill never exceeds the combined ceiling", "[limit]") {
    LimiterFixture f(http::limit::Rate(2, 100ms), http::limit::Rate(3, 100ms));
    REQUIRE(f.limiter.ceiling() == 5);

    REQUIRE(f.limiter.poll_ready().ready_);
    f.limiter.call(testing::get("https://host/"));
    REQUIRE(f.limiter.remaining() == 4);

    // Both pools come due at once while the shared pool is nearly full.
    f.clock->advance(250ms);
    REQUIRE(f.limiter.poll_ready().ready_);
    f.limiter.call(testing::get("https://host/"));
    REQUIRE(f.limiter.remaining() == 4);

    REQUIRE(f.drain() == 4);
}

TEST_CASE("Limiter refuses a call without a ready observation", "[limit]") {
    LimiterFixture f(http::limit::Rate(1, 100ms), http::limit::Rate(1, 100ms));

    SECTION("no poll at all") { REQUIRE_THROWS_AS(f.limiter.call(testing::get("https://host/")), std::logic_error); }

    SECTION("second call reusing one poll") {
        REQUIRE(f.limiter.poll_ready().ready_);
        f.limiter.call(testing::get("https://host/"));
        REQUIRE_THROWS_AS(f.limiter.call(testing::get("https://host/")), std::logic_error);
    }

    SECTION("call while limited") {
        REQUIRE(f.drain() == 2);
        REQUIRE_THROWS_AS(f.limiter.call(testing::get("https://host/")), std::logic_error);
    }

    REQUIRE(f.log->requests_.size() <= 2);
}

TEST_CASE("Limiter passes inner not-ready through without spending a token", "[limit]") {
    auto clock = std::make_shared<testing::ManualClock>();
    auto log = std::make_shared<testing::RecordingService::Log>();
    auto inner = std::make_unique<testing::RecordingService>(log);
    auto* inner_ptr = inner.get();
    http::limit::RateLimitWithBurst limiter(std::move(inner), http::limit::Rate(1, 1s), http::limit::Rate(1, 1s), clock);

    inner_ptr->set_readiness(http::client::Readiness::until(clock->now() + 5ms));

    const auto readiness = limiter.poll_ready();
    REQUIRE_FALSE(readiness.ready_);
    REQUIRE(*readiness.wake_at_ == clock->now() + 5ms);
    REQUIRE(limiter.remaining() == 2);
    REQUIRE_THROWS_AS(limiter.call(testing::get("https://host/")), std::logic_error);

    inner_ptr->set_readiness(http::client::Readiness::now());
    REQUIRE(limiter.poll_ready().ready_);
    limiter.call(testing::get("https://host/"));
    REQUIRE(limiter.remaining() == 1);
}

TEST_CASE("Limiter requires an inner service", "[limit]") {
    auto clock = std::make_shared<testing::ManualClock>();
    REQUIRE_THROWS_AS(http::limit::RateLimitWithBurst(nullptr, http::limit::Rate(1, 1s), http::limit::Rate(1, 1s), clock), std::invalid_argument);
}

TEST_CASE("Limiter requires a clock", "[limit]") {
    auto log = std::make_shared<testing::RecordingService::Log>();
    REQUIRE_THROWS_AS(http::limit::RateLimitWithBurst(std::make_unique<testing::RecordingService>(log), http::limit::Rate(1, 1s),
                                                      http::limit::Rate(1, 1s), nullptr),
                      std::invalid_argument);
}

TEST_CASE("Rate rejects periods longer than a year", "[limit][rate]") {
    REQUIRE_THROWS_AS(http::limit::Rate(1, constants::MAX_RATE_PERIOD + 1h), http::http_error::ConfigError);
    REQUIRE_NOTHROW(http::limit::Rate(1, constants::MAX_RATE_PERIOD));
}

TEST_CASE("Limiter rejects counts whose sum overflows the shared pool", "[limit]") {
    auto clock = std::make_shared<testing::ManualClock>();
    auto log = std::make_shared<testing::RecordingService::Log>();
    const auto max = std::numeric_limits<std::uint64_t>::max();

    REQUIRE_THROWS_AS(http::limit::RateLimitWithBurst(std::make_unique<testing::RecordingService>(log), http::limit::Rate(max, 1s),
                                                      http::limit::Rate(1, 1s), clock),
                      http::http_error::ConfigError);
}

TEST_CASE("Refill saturates at a ceiling of the largest count", "[limit]") {
    const auto max = std::numeric_limits<std::uint64_t>::max();
    LimiterFixture f(http::limit::Rate(max - 1, 100ms), http::limit::Rate(1, 100ms));
    REQUIRE(f.limiter.ceiling() == max);
    REQUIRE(f.limiter.remaining() == max);

    REQUIRE(f.limiter.poll_ready().ready_);
    f.limiter.call(testing::get("https://host/"));
    REQUIRE(f.limiter.remaining() == max - 1);

    // Both pools come due; the refill caps at the ceiling instead of wrapping.
    f.clock->advance(150ms);
    REQUIRE(f.limiter.poll_ready().ready_);
    f.limiter.call(testing::get("https://host/"));
    REQUIRE(f.limiter.remaining() == max - 1);
}
