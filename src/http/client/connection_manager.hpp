#ifndef CATFLEET_CONNECTION_MANAGER_HPP
#define CATFLEET_CONNECTION_MANAGER_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "../../utils/clock.hpp"
#include "interface.hpp"
#include "retry_policy.hpp"
#include "session.hpp"

namespace catfleet::http::client {
    /// Innermost layer of the stack. Holds exactly one session and swaps it wholesale when the
    /// transport closes. Stream cancellations are retried on the same session.
    class ConnectionManager : public IService {
       public:
        // Connects immediately; any handshake failure propagates to the caller.
        ConnectionManager(std::unique_ptr<ISessionFactory> factory, std::string user_agent, std::shared_ptr<utils::IClock> clock,
                          RetryPolicy retry_policy = {});

        [[nodiscard]] Readiness poll_ready() override { return Readiness::now(); }
        http::model::Response call(http::model::Request req) override;

        [[nodiscard]] std::uint64_t reconnect_count() const { return reconnect_count_; }
        [[nodiscard]] std::uint64_t stream_retry_count() const { return stream_retry_count_; }
        [[nodiscard]] bool has_session() const { return session_ != nullptr; }

       private:
        void reconnect(std::size_t& attempts, std::chrono::milliseconds& delay);
        void backoff(std::chrono::milliseconds& delay);

        std::unique_ptr<ISessionFactory> factory_;
        std::unique_ptr<ISession> session_;
        std::string user_agent_;
        std::shared_ptr<utils::IClock> clock_;
        RetryPolicy retry_policy_;

        std::uint64_t reconnect_count_ = 0;
        std::uint64_t stream_retry_count_ = 0;
    };
}  // namespace catfleet::http::client

#endif
