#include "clock.h"

Clock::TimePoint SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

std::shared_ptr<Clock> SteadyClock::instance() {
    static std::shared_ptr<Clock> clock = std::make_shared<SteadyClock>();
    return clock;
}
