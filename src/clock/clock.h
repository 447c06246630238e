#ifndef CLOCK_H
#define CLOCK_H

#include <chrono>
#include <memory>

// Time source shared by rules and sleepers. Rules read it inside their lock.
class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SteadyClock : public Clock {
public:
    TimePoint now() const override;

    static std::shared_ptr<Clock> instance();
};

#endif
