#include "interface.hpp"

#include <chrono>

#include "../model/model.hpp"

namespace catfleet::http::client {
    namespace {
        // Used only when a layer is not ready and cannot say until when.
        constexpr std::chrono::milliseconds UNKNOWN_WAKE_RECHECK{10};
    }  // namespace

    http::model::Response ready_and_call(IService& service, http::model::Request req, utils::IClock& clock) {
        for (;;) {
            const Readiness readiness = service.poll_ready();

            if (readiness.ready_) {
                return service.call(std::move(req));
            }

            clock.sleep_until(readiness.wake_at_.value_or(clock.now() + UNKNOWN_WAKE_RECHECK));
        }
    }
}  // namespace catfleet::http::client
