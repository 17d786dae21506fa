#ifndef CATFLEET_SESSION_HPP
#define CATFLEET_SESSION_HPP

#include <cstdint>
#include <memory>

#include "../model/model.hpp"

namespace catfleet::http::client {
    enum class SessionState {
        READY,
        CLOSED,
    };

    // Send handle for one live transport connection. Never reused once closed.
    class ISession {
       public:
        ISession() = default;
        virtual ~ISession() = default;
        ISession(const ISession&) = delete;
        ISession& operator=(const ISession&) = delete;
        ISession(ISession&&) = delete;
        ISession& operator=(ISession&&) = delete;

        // Blocks until the connection can take a request or is known to be closed.
        [[nodiscard]] virtual SessionState poll_ready() = 0;

        // Throws http_error::StreamCanceled, http_error::TransportClosed or http_error::TransportError.
        virtual http::model::Response send(const http::model::Request& req) = 0;

        [[nodiscard]] virtual std::uint64_t id() const = 0;
    };

    // Performs the full handshake. Throws on any failure; never returns a half-open session.
    class ISessionFactory {
       public:
        ISessionFactory() = default;
        virtual ~ISessionFactory() = default;
        ISessionFactory(const ISessionFactory&) = delete;
        ISessionFactory& operator=(const ISessionFactory&) = delete;
        ISessionFactory(ISessionFactory&&) = delete;
        ISessionFactory& operator=(ISessionFactory&&) = delete;

        virtual std::unique_ptr<ISession> connect() = 0;
    };
}  // namespace catfleet::http::client

#endif
