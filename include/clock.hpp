#pragma once

#include <chrono>
#include <memory>

namespace netguard {

// Time source for the rate limiter. Injected so tests can drive time by hand.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }

    static std::shared_ptr<Clock> shared() {
        static std::shared_ptr<Clock> instance = std::make_shared<SteadyClock>();
        return instance;
    }
};

}
