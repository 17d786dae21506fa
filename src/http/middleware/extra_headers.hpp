#ifndef CATFLEET_EXTRA_HEADERS_HPP
#define CATFLEET_EXTRA_HEADERS_HPP

#include <memory>
#include <string>
#include <string_view>

#include "../client/interface.hpp"
#include "../model/model.hpp"

namespace catfleet::http::middleware {
    // Sets a header that must appear once. If another layer already set it, logs a warning and replaces it.
    void set_header_once(http::model::Headers& headers, std::string_view name, std::string value, std::string_view layer);

    // Appends a fixed, ordered header list to every request. Never removes or overwrites.
    class ExtraHeaders : public http::client::IService {
       public:
        ExtraHeaders(std::unique_ptr<http::client::IService> inner, std::shared_ptr<const http::model::Headers> headers);

        [[nodiscard]] http::client::Readiness poll_ready() override { return inner_->poll_ready(); }
        http::model::Response call(http::model::Request req) override;

       private:
        std::unique_ptr<http::client::IService> inner_;
        std::shared_ptr<const http::model::Headers> headers_;
    };

    // Adds "authorization: Bearer <token>" to every request.
    class BearerAuth : public http::client::IService {
       public:
        BearerAuth(std::unique_ptr<http::client::IService> inner, const std::string& token);

        [[nodiscard]] http::client::Readiness poll_ready() override { return inner_->poll_ready(); }
        http::model::Response call(http::model::Request req) override;

       private:
        std::unique_ptr<http::client::IService> inner_;
        std::string header_value_;
    };
}  // namespace catfleet::http::middleware

#endif
