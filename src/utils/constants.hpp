#ifndef CATFLEET_CONSTANTS_HPP
#define CATFLEET_CONSTANTS_HPP

#include <chrono>
#include <cstdint>

namespace catfleet::constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr std::uint16_t HTTPS_DEFAULT_PORT = 443;
    inline constexpr const char* HTTPS_SCHEME = "https";
    inline constexpr const char* DEFAULT_BASE_URL = "https://api.spacetraders.io/v2/";
    inline constexpr const char* DEFAULT_USER_AGENT = "catfleet/0.1.0";
    inline constexpr const char* DEFAULT_LOG_LEVEL = "info";

    // SpaceTraders allows 2 requests per second plus a burst of 30 per minute.
    inline constexpr std::uint64_t DEFAULT_RATE_COUNT = 2;
    inline constexpr std::chrono::milliseconds DEFAULT_RATE_PERIOD{1'000};
    inline constexpr std::uint64_t BURST_RATE_COUNT = 30;
    inline constexpr std::chrono::milliseconds BURST_RATE_PERIOD{60'000};
    // Longest refill period a rate may use; keeps refill deadlines representable.
    inline constexpr std::chrono::hours MAX_RATE_PERIOD{24 * 365};

    inline constexpr std::chrono::milliseconds CONNECT_TIMEOUT{10'000};
    inline constexpr std::chrono::milliseconds REQUEST_TIMEOUT{30'000};

    inline constexpr long HTTP_SUCCESS_LOWER_BOUNDARY = 200;
    inline constexpr long HTTP_SUCCESS_UPPER_BOUNDARY = 300;
}  // namespace catfleet::constants

#endif
