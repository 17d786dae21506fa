#ifndef CATFLEET_OPTIONS_HPP
#define CATFLEET_OPTIONS_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "../http/client/retry_policy.hpp"
#include "../http/limit/rate.hpp"
#include "../http/model/model.hpp"
#include "../utils/constants.hpp"

namespace catfleet::config {
    struct ClientOptions {
        std::string base_url_ = constants::DEFAULT_BASE_URL;
        http::limit::Rate rate_default_{constants::DEFAULT_RATE_COUNT, constants::DEFAULT_RATE_PERIOD};
        http::limit::Rate rate_burst_{constants::BURST_RATE_COUNT, constants::BURST_RATE_PERIOD};
        std::optional<std::string> bearer_token_;
        http::model::Headers extra_headers_;
        std::string user_agent_ = constants::DEFAULT_USER_AGENT;
        std::chrono::milliseconds connect_timeout_ = constants::CONNECT_TIMEOUT;
        std::chrono::milliseconds request_timeout_ = constants::REQUEST_TIMEOUT;
        // Empty uses the system trust store.
        std::string ca_file_;
        http::client::RetryPolicy retry_policy_;
        std::string log_level_ = constants::DEFAULT_LOG_LEVEL;
    };

    // "<count>/<milliseconds>", e.g. "2/1000". Throws http_error::ConfigError.
    [[nodiscard]] http::limit::Rate parse_rate(std::string_view text);

    // Comma separated "Name: value" pairs. Throws http_error::ConfigError.
    [[nodiscard]] http::model::Headers parse_header_list(std::string_view text);

    // Defaults overlaid with CATFLEET_* and SPACETRADERS_TOKEN from the environment.
    [[nodiscard]] ClientOptions load_options_from_env();
}  // namespace catfleet::config

#endif
