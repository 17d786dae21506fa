#include "extra_headers.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "../../utils/logging.hpp"
#include "../error/http_error.hpp"

namespace catfleet::http::middleware {
    namespace {
        constexpr const char* AUTHORIZATION = "authorization";
        constexpr const char* BEARER_PREFIX = "Bearer ";

        std::shared_ptr<spdlog::logger> headers_log() {
            static auto logger = logging::category_logger("catfleet.headers");
            return logger;
        }
    }  // namespace

    void set_header_once(http::model::Headers& headers, std::string_view name, std::string value, std::string_view layer) {
        const auto count = http::model::count_header(headers, name);
        auto previous = http::model::set_header(headers, name, std::move(value));

        if (previous) {
            // Another layer got there first; the stack is composed in the wrong order.
            headers_log()->warn("{} header should only be set in one place; {} replaced {} existing value(s)", name, layer, count);
        }
    }

    ExtraHeaders::ExtraHeaders(std::unique_ptr<http::client::IService> inner, std::shared_ptr<const http::model::Headers> headers)
        : inner_(std::move(inner)), headers_(std::move(headers)) {
        if (inner_ == nullptr) {
            throw std::invalid_argument("ExtraHeaders requires an inner service");
        }
        if (headers_ == nullptr) {
            headers_ = std::make_shared<const http::model::Headers>();
        }
    }

    http::model::Response ExtraHeaders::call(http::model::Request req) {
        req.headers_.insert(req.headers_.end(), headers_->begin(), headers_->end());
        return inner_->call(std::move(req));
    }

    BearerAuth::BearerAuth(std::unique_ptr<http::client::IService> inner, const std::string& token)
        : inner_(std::move(inner)), header_value_(std::string(BEARER_PREFIX) + token) {
        if (inner_ == nullptr) {
            throw std::invalid_argument("BearerAuth requires an inner service");
        }
        if (token.empty()) {
            throw http::http_error::ConfigError("bearer token must not be empty");
        }
    }

    http::model::Response BearerAuth::call(http::model::Request req) {
        set_header_once(req.headers_, AUTHORIZATION, header_value_, "BearerAuth");
        return inner_->call(std::move(req));
    }
}  // namespace catfleet::http::middleware
