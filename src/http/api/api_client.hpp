#ifndef CATFLEET_API_CLIENT_HPP
#define CATFLEET_API_CLIENT_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../../config/options.hpp"
#include "../../utils/clock.hpp"
#include "../client/interface.hpp"
#include "../client/session.hpp"
#include "../model/model.hpp"

namespace catfleet::http::api {

    struct GameStats {
        std::uint64_t agents_{};
        std::uint64_t ships_{};
        std::uint64_t systems_{};
        std::uint64_t waypoints_{};
    };

    struct ServerResets {
        std::string next_;
        std::string frequency_;
    };

    struct Announcement {
        std::string title_;
        std::string body_;
    };

    struct Link {
        std::string name_;
        std::string url_;
    };

    struct ServerStatus {
        std::string status_;
        std::string version_;
        std::string reset_date_;
        std::string description_;
        GameStats stats_{};
        ServerResets server_resets_{};
        std::vector<Announcement> announcements_{};
        std::vector<Link> links_{};
    };

    // Throws http_error::HttpError when the body is not a server status document.
    [[nodiscard]] ServerStatus parse_server_status(const http::model::Response& resp);

    /// Front door of the request stack. Every call runs the readiness-then-call sequence under
    /// one lock, so the layers below only ever see one caller at a time.
    class ApiClient {
       public:
        ApiClient(std::unique_ptr<http::client::IService> stack, std::shared_ptr<utils::IClock> clock);

        // `target` is origin-form ("/my/ships") or absolute. Transport failures propagate as
        // http_error::TransportError; any status code is returned as-is.
        http::model::Response send(std::string method, const std::string& target, http::model::Headers headers = {}, std::string body = {});

        // GET / on the base url. Throws http_error::HttpError on a non-2xx status or a bad body.
        ServerStatus get_status();

       private:
        std::mutex mutex_;
        std::unique_ptr<http::client::IService> stack_;
        std::shared_ptr<utils::IClock> clock_;
    };

    class ClientBuilder {
       public:
        ClientBuilder() = default;

        ClientBuilder& with_options(config::ClientOptions options);
        ClientBuilder& with_base_url(std::string base_url);
        ClientBuilder& with_rates(http::limit::Rate rate_default, http::limit::Rate rate_burst);
        ClientBuilder& with_bearer_token(std::string token);
        ClientBuilder& with_extra_headers(http::model::Headers headers);
        ClientBuilder& with_user_agent(std::string user_agent);
        ClientBuilder& with_retry_policy(http::client::RetryPolicy retry_policy);
        ClientBuilder& with_session_factory(std::unique_ptr<http::client::ISessionFactory> session_factory);
        ClientBuilder& with_clock(std::shared_ptr<utils::IClock> clock);
        ClientBuilder& validate();

        // Connects the first session. Throws http_error::ConfigError or http_error::TransportError.
        std::unique_ptr<ApiClient> build();

       private:
        config::ClientOptions options_;
        std::unique_ptr<http::client::ISessionFactory> session_factory_;
        std::shared_ptr<utils::IClock> clock_;
    };

}  // namespace catfleet::http::api

#endif
