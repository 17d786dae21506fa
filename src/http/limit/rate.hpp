#ifndef CATFLEET_RATE_HPP
#define CATFLEET_RATE_HPP

#include <chrono>
#include <cstdint>
#include <string>

#include "../../utils/constants.hpp"
#include "../error/http_error.hpp"

namespace catfleet::http::limit {
    // A number of calls per time period.
    class Rate {
       public:
        // Throws http_error::ConfigError if `count` or `period` is zero, or `period` exceeds a year.
        Rate(std::uint64_t count, std::chrono::nanoseconds period) : count_(count), period_(period) {
            if (count_ == 0) {
                throw http::http_error::ConfigError("rate count must be greater than zero");
            }
            if (period_ <= std::chrono::nanoseconds::zero()) {
                throw http::http_error::ConfigError("rate period must be greater than zero");
            }
            if (period_ > constants::MAX_RATE_PERIOD) {
                throw http::http_error::ConfigError("rate period must not exceed one year");
            }
        }

        [[nodiscard]] std::uint64_t count() const { return count_; }
        [[nodiscard]] std::chrono::nanoseconds period() const { return period_; }

        bool operator==(const Rate&) const = default;

       private:
        std::uint64_t count_;
        std::chrono::nanoseconds period_;
    };
}  // namespace catfleet::http::limit

#endif
