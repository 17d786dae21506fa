#ifndef CATFLEET_CLIENT_INTERFACE_HPP
#define CATFLEET_CLIENT_INTERFACE_HPP

#include <chrono>
#include <optional>

#include "../../utils/clock.hpp"
#include "../model/model.hpp"

namespace catfleet::http::client {
    struct Readiness {
        bool ready_ = true;
        // Set when not ready and the layer knows when it will be.
        std::optional<utils::IClock::time_point> wake_at_;

        static Readiness now() { return Readiness{}; }
        static Readiness until(utils::IClock::time_point wake_at) { return Readiness{.ready_ = false, .wake_at_ = wake_at}; }
    };

    // Two-phase call capability shared by every layer of the stack and the transport.
    // `call` may only follow a `poll_ready` that reported ready.
    class IService {
       public:
        IService() = default;
        virtual ~IService() = default;
        IService(const IService&) = delete;
        IService& operator=(const IService&) = delete;
        IService(IService&&) = delete;
        IService& operator=(IService&&) = delete;

        [[nodiscard]] virtual Readiness poll_ready() = 0;
        virtual http::model::Response call(http::model::Request req) = 0;
    };

    // Polls until ready, sleeping on `clock` until each reported wake time, then calls once.
    http::model::Response ready_and_call(IService& service, http::model::Request req, utils::IClock& clock);
}  // namespace catfleet::http::client

#endif
