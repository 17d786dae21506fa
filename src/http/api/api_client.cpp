#include "api_client.hpp"

#include <simdjson.h>

#include <stdexcept>
#include <string>
#include <string_view>

#include "../../utils/logging.hpp"
#include "../client/connection_manager.hpp"
#include "../client/curl_session.hpp"
#include "../error/http_error.hpp"
#include "../limit/rate_limit_with_burst.hpp"
#include "../middleware/base_url.hpp"
#include "../middleware/extra_headers.hpp"
#include "../model/url.hpp"

using namespace simdjson;

namespace catfleet::http::api {
    namespace {
        std::shared_ptr<spdlog::logger> client_log() {
            static auto logger = logging::category_logger("catfleet.client");
            return logger;
        }

        std::string as_string(simdjson_result<ondemand::value> v) { return std::string(std::string_view(v)); }

        http::model::Url parse_base_url(const std::string& text) {
            try {
                return http::model::Url::parse(text);
            } catch (const std::invalid_argument& e) {
                throw http::http_error::ConfigError("invalid base url '" + text + "': " + e.what());
            }
        }
    }  // namespace

    ServerStatus parse_server_status(const http::model::Response& resp) {
        ServerStatus out{};

        try {
            ondemand::parser parser;
            padded_string json(resp.body_);
            ondemand::document doc = parser.iterate(json);

            out.status_ = as_string(doc["status"]);
            out.version_ = as_string(doc["version"]);
            out.reset_date_ = as_string(doc["resetDate"]);
            out.description_ = as_string(doc["description"]);

            if (doc["stats"].error() == simdjson::SUCCESS) {
                auto stats = doc["stats"];
                out.stats_.agents_ = uint64_t(stats["agents"]);
                out.stats_.ships_ = uint64_t(stats["ships"]);
                out.stats_.systems_ = uint64_t(stats["systems"]);
                out.stats_.waypoints_ = uint64_t(stats["waypoints"]);
            }

            if (doc["serverResets"].error() == simdjson::SUCCESS) {
                auto resets = doc["serverResets"];
                out.server_resets_.next_ = as_string(resets["next"]);
                out.server_resets_.frequency_ = as_string(resets["frequency"]);
            }

            if (doc["announcements"].error() == simdjson::SUCCESS) {
                for (auto announcement : doc["announcements"]) {
                    out.announcements_.push_back(Announcement{.title_ = as_string(announcement["title"]), .body_ = as_string(announcement["body"])});
                }
            }

            if (doc["links"].error() == simdjson::SUCCESS) {
                for (auto link : doc["links"]) {
                    out.links_.push_back(Link{.name_ = as_string(link["name"]), .url_ = as_string(link["url"])});
                }
            }
        } catch (const simdjson::simdjson_error& e) {
            throw http::http_error::HttpError(resp.status_, resp.effective_url_, resp.body_.substr(0, http::http_error::ERROR_MESSAGE_LENGTH),
                                              "Failed to parse JSON response: " + std::string(e.what()));
        }

        return out;
    }

    //
    // ApiClient implementation
    //

    ApiClient::ApiClient(std::unique_ptr<http::client::IService> stack, std::shared_ptr<utils::IClock> clock)
        : stack_(std::move(stack)), clock_(std::move(clock)) {
        if (stack_ == nullptr || clock_ == nullptr) {
            throw std::invalid_argument("ApiClient requires a service stack and a clock");
        }
    }

    http::model::Response ApiClient::send(std::string method, const std::string& target, http::model::Headers headers, std::string body) {
        http::model::Request req;
        req.method_ = std::move(method);
        req.url_ = target;
        req.headers_ = std::move(headers);
        req.body_ = std::move(body);

        std::lock_guard<std::mutex> lock(mutex_);
        client_log()->debug("{} {}", req.method_, target);
        http::model::Response resp = http::client::ready_and_call(*stack_, std::move(req), *clock_);
        client_log()->debug("{} {} -> {}", resp.effective_url_, http::model::to_string(resp.version_), resp.status_);
        return resp;
    }

    ServerStatus ApiClient::get_status() {
        const http::model::Response resp = send("GET", "/", {http::model::Header{.name_ = "accept", .value_ = "application/json"}});

        if (resp.status_ < constants::HTTP_SUCCESS_LOWER_BOUNDARY || resp.status_ >= constants::HTTP_SUCCESS_UPPER_BOUNDARY) {
            throw http::http_error::HttpError(resp.status_, resp.effective_url_, resp.body_.substr(0, http::http_error::ERROR_MESSAGE_LENGTH),
                                              "HTTP request failed with status " + std::to_string(resp.status_));
        }

        return parse_server_status(resp);
    }

    //
    // ClientBuilder implementation
    //

    ClientBuilder& ClientBuilder::with_options(config::ClientOptions options) {
        options_ = std::move(options);
        return *this;
    }

    ClientBuilder& ClientBuilder::with_base_url(std::string base_url) {
        options_.base_url_ = std::move(base_url);
        return *this;
    }

    ClientBuilder& ClientBuilder::with_rates(http::limit::Rate rate_default, http::limit::Rate rate_burst) {
        options_.rate_default_ = rate_default;
        options_.rate_burst_ = rate_burst;
        return *this;
    }

    ClientBuilder& ClientBuilder::with_bearer_token(std::string token) {
        options_.bearer_token_ = std::move(token);
        return *this;
    }

    ClientBuilder& ClientBuilder::with_extra_headers(http::model::Headers headers) {
        options_.extra_headers_ = std::move(headers);
        return *this;
    }

    ClientBuilder& ClientBuilder::with_user_agent(std::string user_agent) {
        options_.user_agent_ = std::move(user_agent);
        return *this;
    }

    ClientBuilder& ClientBuilder::with_retry_policy(http::client::RetryPolicy retry_policy) {
        options_.retry_policy_ = retry_policy;
        return *this;
    }

    ClientBuilder& ClientBuilder::with_session_factory(std::unique_ptr<http::client::ISessionFactory> session_factory) {
        session_factory_ = std::move(session_factory);
        return *this;
    }

    ClientBuilder& ClientBuilder::with_clock(std::shared_ptr<utils::IClock> clock) {
        clock_ = std::move(clock);
        return *this;
    }

    ClientBuilder& ClientBuilder::validate() {
        const http::model::Url base = parse_base_url(options_.base_url_);
        if (!base.is_absolute()) {
            throw http::http_error::ConfigError("Base url must be absolute: '" + options_.base_url_ + "'");
        }
        if (base.scheme_ != constants::HTTPS_SCHEME) {
            throw http::http_error::ConfigError("Base url must use https: '" + options_.base_url_ + "'");
        }
        if (options_.user_agent_.empty()) {
            throw http::http_error::ConfigError("User agent is required");
        }
        if (options_.bearer_token_.has_value() && options_.bearer_token_->empty()) {
            throw http::http_error::ConfigError("Bearer token must not be empty");
        }

        return *this;
    }

    std::unique_ptr<ApiClient> ClientBuilder::build() {
        validate();

        const http::model::Url base = parse_base_url(options_.base_url_);
        std::shared_ptr<utils::IClock> clock = clock_;
        if (clock == nullptr) {
            clock = std::make_shared<utils::SteadyClock>();
        }

        auto factory = std::move(session_factory_);
        if (factory == nullptr) {
            factory = std::make_unique<http::client::CurlSessionFactory>(
                http::model::Url{.scheme_ = base.scheme_, .authority_ = base.authority_, .path_and_query_ = "/"},
                http::client::CurlSessionOptions{
                    .connect_timeout_ = options_.connect_timeout_, .request_timeout_ = options_.request_timeout_, .ca_file_ = options_.ca_file_});
        }

        // Innermost first.
        std::unique_ptr<http::client::IService> stack =
            std::make_unique<http::client::ConnectionManager>(std::move(factory), options_.user_agent_, clock, options_.retry_policy_);
        stack = std::make_unique<http::limit::RateLimitWithBurst>(std::move(stack), options_.rate_default_, options_.rate_burst_, clock);
        if (options_.bearer_token_.has_value()) {
            stack = std::make_unique<http::middleware::BearerAuth>(std::move(stack), *options_.bearer_token_);
        }
        if (!options_.extra_headers_.empty()) {
            stack = std::make_unique<http::middleware::ExtraHeaders>(std::move(stack), std::make_shared<const http::model::Headers>(options_.extra_headers_));
        }
        stack = std::make_unique<http::middleware::BaseUrl>(std::move(stack), base);

        client_log()->debug("client stack built for {}", base.to_string());
        return std::make_unique<ApiClient>(std::move(stack), std::move(clock));
    }

}  // namespace catfleet::http::api
