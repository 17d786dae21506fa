#include <catch2/catch.hpp>

#include <chrono>
#include <cstdlib>

#include "config/options.hpp"
#include "http/error/http_error.hpp"

using namespace catfleet;
using namespace std::chrono_literals;

namespace {
    constexpr const char* KEYS[] = {"CATFLEET_BASE_URL",  "SPACETRADERS_TOKEN",  "CATFLEET_RATE_DEFAULT",   "CATFLEET_RATE_BURST", "CATFLEET_EXTRA_HEADERS",
                                    "CATFLEET_USER_AGENT", "CATFLEET_CA_FILE", "CATFLEET_MAX_RECONNECTS", "CATFLEET_LOG_LEVEL"};

    struct CleanEnv {
        CleanEnv() { clear(); }
        ~CleanEnv() { clear(); }

        static void clear() {
            for (const char* key : KEYS) {
                unsetenv(key);
            }
        }
    };
}  // namespace

TEST_CASE("parse_rate reads count and milliseconds", "[config]") {
    REQUIRE(config::parse_rate("2/1000") == http::limit::Rate(2, 1000ms));
    REQUIRE(config::parse_rate(" 30 / 60000 ") == http::limit::Rate(30, 60000ms));
}

TEST_CASE("parse_rate rejects malformed rates", "[config]") {
    for (const char* bad : {"", "2", "2/", "/1000", "a/1000", "2/1s", "-1/1000", "0/1000", "2/0"}) {
        INFO(bad);
        REQUIRE_THROWS_AS(config::parse_rate(bad), http::http_error::ConfigError);
    }
}

TEST_CASE("parse_rate rejects counts and periods out of range", "[config]") {
    // One past the largest unsigned 64-bit value.
    REQUIRE_THROWS_AS(config::parse_rate("18446744073709551616/1000"), http::http_error::ConfigError);
    REQUIRE_THROWS_AS(config::parse_rate("2/18446744073709551616"), http::http_error::ConfigError);
    // A year and one millisecond.
    REQUIRE_THROWS_AS(config::parse_rate("1/31536000001"), http::http_error::ConfigError);
    REQUIRE_THROWS_AS(config::parse_rate("18446744073709551615/18446744073709551615"), http::http_error::ConfigError);

    REQUIRE(config::parse_rate("18446744073709551615/1000") == http::limit::Rate(18446744073709551615ULL, 1000ms));
    REQUIRE(config::parse_rate("1/31536000000") == http::limit::Rate(1, 31536000000ms));
}

TEST_CASE("parse_header_list keeps order and duplicates", "[config]") {
    const auto headers = config::parse_header_list("x-a: 1, accept: application/json ,x-a:2");

    REQUIRE(headers == http::model::Headers{{"x-a", "1"}, {"accept", "application/json"}, {"x-a", "2"}});
    REQUIRE(config::parse_header_list("").empty());
}

TEST_CASE("parse_header_list rejects entries without a name", "[config]") {
    REQUIRE_THROWS_AS(config::parse_header_list("novalue"), http::http_error::ConfigError);
    REQUIRE_THROWS_AS(config::parse_header_list(": value"), http::http_error::ConfigError);
    REQUIRE_THROWS_AS(config::parse_header_list("bad name: value"), http::http_error::ConfigError);
}

TEST_CASE("load_options_from_env uses defaults when nothing is set", "[config]") {
    CleanEnv env;
    const auto options = config::load_options_from_env();

    REQUIRE(options.base_url_ == "https://api.spacetraders.io/v2/");
    REQUIRE(options.rate_default_ == http::limit::Rate(2, 1s));
    REQUIRE(options.rate_burst_ == http::limit::Rate(30, 60s));
    REQUIRE_FALSE(options.bearer_token_.has_value());
    REQUIRE(options.extra_headers_.empty());
    REQUIRE(options.user_agent_ == "catfleet/0.1.0");
    REQUIRE(options.log_level_ == "info");
    REQUIRE(options.retry_policy_.max_reconnects_ == 0);
}

TEST_CASE("load_options_from_env overlays the environment", "[config]") {
    CleanEnv env;
    setenv("CATFLEET_BASE_URL", "https://127.0.0.1:3000/", 1);
    setenv("SPACETRADERS_TOKEN", "tok", 1);
    setenv("CATFLEET_RATE_DEFAULT", "1/100", 1);
    setenv("CATFLEET_RATE_BURST", "2/400", 1);
    setenv("CATFLEET_EXTRA_HEADERS", "x-client: tests", 1);
    setenv("CATFLEET_USER_AGENT", "fleet-test/1", 1);
    setenv("CATFLEET_MAX_RECONNECTS", "3", 1);
    setenv("CATFLEET_LOG_LEVEL", "debug", 1);

    const auto options = config::load_options_from_env();

    REQUIRE(options.base_url_ == "https://127.0.0.1:3000/");
    REQUIRE(options.bearer_token_ == "tok");
    REQUIRE(options.rate_default_ == http::limit::Rate(1, 100ms));
    REQUIRE(options.rate_burst_ == http::limit::Rate(2, 400ms));
    REQUIRE(options.extra_headers_ == http::model::Headers{{"x-client", "tests"}});
    REQUIRE(options.user_agent_ == "fleet-test/1");
    REQUIRE(options.retry_policy_.max_reconnects_ == 3);
    REQUIRE(options.log_level_ == "debug");
}

TEST_CASE("load_options_from_env rejects a malformed rate", "[config]") {
    CleanEnv env;
    setenv("CATFLEET_RATE_BURST", "thirty", 1);

    REQUIRE_THROWS_AS(config::load_options_from_env(), http::http_error::ConfigError);
}
