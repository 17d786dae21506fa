#ifndef CATFLEET_BASE_URL_HPP
#define CATFLEET_BASE_URL_HPP

#include <memory>

#include "../client/interface.hpp"
#include "../model/url.hpp"

namespace catfleet::http::middleware {
    // Joins `input` onto `base`. Scheme and authority come from `input` when it has them.
    // A path on `base` is prefixed to the input path unless the input already starts with it.
    [[nodiscard]] http::model::Url overwrite_base_url(const http::model::Url& base, const http::model::Url& input);

    class BaseUrl : public http::client::IService {
       public:
        // Throws http_error::ConfigError unless `base_url` is absolute.
        BaseUrl(std::unique_ptr<http::client::IService> inner, http::model::Url base_url);

        [[nodiscard]] http::client::Readiness poll_ready() override { return inner_->poll_ready(); }
        http::model::Response call(http::model::Request req) override;

        [[nodiscard]] const http::model::Url& base_url() const { return base_url_; }

       private:
        std::unique_ptr<http::client::IService> inner_;
        const http::model::Url base_url_;
    };
}  // namespace catfleet::http::middleware

#endif
