#include "options.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <string>

#include "../http/error/http_error.hpp"
#include "../utils/string_utils.hpp"

namespace catfleet::config {
    namespace {
        struct EnvKeys {
            static constexpr const char* BASE_URL = "CATFLEET_BASE_URL";
            static constexpr const char* TOKEN = "SPACETRADERS_TOKEN";
            static constexpr const char* RATE_DEFAULT = "CATFLEET_RATE_DEFAULT";
            static constexpr const char* RATE_BURST = "CATFLEET_RATE_BURST";
            static constexpr const char* EXTRA_HEADERS = "CATFLEET_EXTRA_HEADERS";
            static constexpr const char* USER_AGENT = "CATFLEET_USER_AGENT";
            static constexpr const char* CA_FILE = "CATFLEET_CA_FILE";
            static constexpr const char* MAX_RECONNECTS = "CATFLEET_MAX_RECONNECTS";
            static constexpr const char* LOG_LEVEL = "CATFLEET_LOG_LEVEL";
        };

        // Unset and empty both count as absent.
        std::optional<std::string> env(const char* key) {
            const char* value = std::getenv(key);
            if (value == nullptr || *value == '\0') {
                return std::nullopt;
            }
            return std::string(value);
        }

        unsigned long long as_count(const std::string& s, const std::string& what) {
            char* end = nullptr;
            errno = 0;
            const unsigned long long v = std::strtoull(s.c_str(), &end, constants::BASE_10);
            if (s.empty() || s.front() == '-' || end == nullptr || *end != '\0' || errno == ERANGE) {
                throw http::http_error::ConfigError("invalid " + what + ": '" + s + "'");
            }
            return v;
        }
    }  // namespace

    http::limit::Rate parse_rate(std::string_view text) {
        const std::string trimmed = string_utils::trim(std::string(text));
        const auto slash = trimmed.find('/');
        if (slash == std::string::npos) {
            throw http::http_error::ConfigError("rate must look like <count>/<milliseconds>: '" + trimmed + "'");
        }

        const auto count = as_count(string_utils::trim(trimmed.substr(0, slash)), "rate count");
        const auto period_ms = as_count(string_utils::trim(trimmed.substr(slash + 1)), "rate period");
        if (period_ms > static_cast<unsigned long long>(std::chrono::duration_cast<std::chrono::milliseconds>(constants::MAX_RATE_PERIOD).count())) {
            throw http::http_error::ConfigError("rate period must not exceed one year: '" + trimmed + "'");
        }

        return http::limit::Rate(count, std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(period_ms)));
    }

    http::model::Headers parse_header_list(std::string_view text) {
        http::model::Headers out;

        for (const auto& entry : string_utils::split_comma_delimited_string(text)) {
            const auto colon = entry.find(':');
            if (colon == std::string::npos) {
                throw http::http_error::ConfigError("header must look like 'Name: value': '" + entry + "'");
            }

            std::string name = string_utils::trim(entry.substr(0, colon));
            if (name.empty() || name.find_first_of(" \t") != std::string::npos) {
                throw http::http_error::ConfigError("invalid header name in '" + entry + "'");
            }

            out.push_back(http::model::Header{.name_ = std::move(name), .value_ = string_utils::trim(entry.substr(colon + 1))});
        }

        return out;
    }

    ClientOptions load_options_from_env() {
        ClientOptions options;

        if (auto v = env(EnvKeys::BASE_URL)) {
            options.base_url_ = *v;
        }
        if (auto v = env(EnvKeys::TOKEN)) {
            options.bearer_token_ = *v;
        }
        if (auto v = env(EnvKeys::RATE_DEFAULT)) {
            options.rate_default_ = parse_rate(*v);
        }
        if (auto v = env(EnvKeys::RATE_BURST)) {
            options.rate_burst_ = parse_rate(*v);
        }
        if (auto v = env(EnvKeys::EXTRA_HEADERS)) {
            options.extra_headers_ = parse_header_list(*v);
        }
        if (auto v = env(EnvKeys::USER_AGENT)) {
            options.user_agent_ = *v;
        }
        if (auto v = env(EnvKeys::CA_FILE)) {
            options.ca_file_ = *v;
        }
        if (auto v = env(EnvKeys::MAX_RECONNECTS)) {
            options.retry_policy_.max_reconnects_ = static_cast<std::size_t>(as_count(*v, "reconnect limit"));
        }
        if (auto v = env(EnvKeys::LOG_LEVEL)) {
            options.log_level_ = *v;
        }

        return options;
    }
}  // namespace catfleet::config
