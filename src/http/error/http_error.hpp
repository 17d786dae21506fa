#ifndef CATFLEET_HTTP_ERROR_HPP
#define CATFLEET_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>

namespace catfleet::http::http_error {
    const long ERROR_MESSAGE_LENGTH = 512;

    // Endpoint-level failure: unexpected status or an unreadable body.
    struct HttpError : public std::runtime_error {
        long status_;
        std::string url_;
        std::string body_preview_;
        explicit HttpError(long s, std::string u, std::string preview, const std::string &msg);
    };

    // Invalid options handed to a layer or the builder. Fatal to construction.
    struct ConfigError : public std::runtime_error {
        explicit ConfigError(const std::string &msg);
    };

    // Terminal transport failure for one call, or a failed handshake at construction.
    struct TransportError : public std::runtime_error {
        std::string url_;
        explicit TransportError(const std::string &msg, std::string u = {});
    };

    // The session as a whole is gone. The connection manager reconnects.
    struct TransportClosed : public TransportError {
        explicit TransportClosed(const std::string &msg, std::string u = {});
    };

    // A single stream was reset while the session stays usable. The connection manager retries.
    struct StreamCanceled : public TransportError {
        explicit StreamCanceled(const std::string &msg, std::string u = {});
    };
}  // namespace catfleet::http::http_error

#endif
