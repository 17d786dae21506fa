#include "http_error.hpp"

#include <stdexcept>
#include <string>

namespace catfleet::http::http_error {
    HttpError::HttpError(long s, std::string u,
                         std::string preview,     // NOLINT(bugprone-easily-swappable-parameters)
                         const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : std::runtime_error(msg), status_(s), url_(std::move(u)), body_preview_(std::move(preview)) {}

    ConfigError::ConfigError(const std::string &msg) : std::runtime_error(msg) {}

    TransportError::TransportError(const std::string &msg, std::string u) : std::runtime_error(msg), url_(std::move(u)) {}

    TransportClosed::TransportClosed(const std::string &msg, std::string u) : TransportError(msg, std::move(u)) {}

    StreamCanceled::StreamCanceled(const std::string &msg, std::string u) : TransportError(msg, std::move(u)) {}
};  // namespace catfleet::http::http_error
