#ifndef CATFLEET_RETRY_POLICY_HPP
#define CATFLEET_RETRY_POLICY_HPP

#include <chrono>
#include <cstddef>

namespace catfleet::http::client {
    // Zero limits mean unbounded. The defaults retry forever without backoff.
    // The delay applies before every stream retry and every reconnect, doubling up to `max_delay_`.
    struct RetryPolicy {
        std::size_t max_stream_retries_ = 0;
        std::size_t max_reconnects_ = 0;
        std::chrono::milliseconds base_delay_{0};
        std::chrono::milliseconds max_delay_{0};
    };
}  // namespace catfleet::http::client

#endif
