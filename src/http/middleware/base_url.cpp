#include "base_url.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "../error/http_error.hpp"

namespace catfleet::http::middleware {

    http::model::Url overwrite_base_url(const http::model::Url& base, const http::model::Url& input) {
        http::model::Url out;
        out.scheme_ = input.scheme_.empty() ? base.scheme_ : input.scheme_;
        out.authority_ = input.authority_.empty() ? base.authority_ : input.authority_;

        if (!base.path_and_query_.empty()) {
            if (!input.path_and_query_.empty()) {
                std::string base_path = base.path();
                base_path.erase(base_path.find_last_not_of('/') + 1);

                if (!input.path_and_query_.starts_with(base_path)) {
                    out.path_and_query_ = base_path + input.path_and_query_;
                } else {
                    out.path_and_query_ = input.path_and_query_;
                }
            } else {
                out.path_and_query_ = base.path_and_query_;
            }
        } else {
            out.path_and_query_ = input.path_and_query_;
        }

        if (out.path_and_query_.empty()) {
            out.path_and_query_ = "/";
        }

        if (!out.is_absolute() || out.path_and_query_.front() != '/') {
            throw std::logic_error("joining valid urls produced an invalid url: '" + out.to_string() + "'");
        }

        return out;
    }

    BaseUrl::BaseUrl(std::unique_ptr<http::client::IService> inner, http::model::Url base_url) : inner_(std::move(inner)), base_url_(std::move(base_url)) {
        if (inner_ == nullptr) {
            throw std::invalid_argument("BaseUrl requires an inner service");
        }
        if (!base_url_.is_absolute()) {
            throw http::http_error::ConfigError("base url must be absolute: '" + base_url_.to_string() + "'");
        }
    }

    http::model::Response BaseUrl::call(http::model::Request req) {
        req.url_ = overwrite_base_url(base_url_, http::model::Url::parse(req.url_)).to_string();
        return inner_->call(std::move(req));
    }
}  // namespace catfleet::http::middleware
