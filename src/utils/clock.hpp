#ifndef CATFLEET_CLOCK_HPP
#define CATFLEET_CLOCK_HPP

#include <chrono>
#include <thread>

namespace catfleet::utils {
    class IClock {
       public:
        using time_point = std::chrono::steady_clock::time_point;

        IClock() = default;
        virtual ~IClock() = default;
        IClock(const IClock&) = delete;
        IClock& operator=(const IClock&) = delete;
        IClock(IClock&&) = delete;
        IClock& operator=(IClock&&) = delete;

        [[nodiscard]] virtual time_point now() const = 0;
        virtual void sleep_until(time_point deadline) = 0;
    };

    class SteadyClock : public IClock {
       public:
        [[nodiscard]] time_point now() const override { return std::chrono::steady_clock::now(); }
        void sleep_until(time_point deadline) override { std::this_thread::sleep_until(deadline); }
    };
}  // namespace catfleet::utils

#endif
