#ifndef TEST_SUPPORT_H
#define TEST_SUPPORT_H

#include "../src/clock/clock.h"
#include "../src/rate_limiter/errors.h"
#include "../src/scheduler/sleeper.h"
#include <algorithm>
#include <chrono>
#include <coroutine>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <vector>

// Instant `seconds` after the manual clock's origin.
inline Clock::TimePoint at(double seconds) {
    return Clock::TimePoint{} +
           std::chrono::duration_cast<Clock::Duration>(std::chrono::duration<double>(seconds));
}

class ManualClock : public Clock {
public:
    TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex);
        return current;
    }

    void advanceTo(TimePoint t) {
        std::lock_guard<std::mutex> lock(mutex);
        if (t > current) {
            current = t;
        }
    }

    void advance(Duration d) {
        std::lock_guard<std::mutex> lock(mutex);
        current += d;
    }

private:
    mutable std::mutex mutex;
    TimePoint current{};
};

// Sleeps in virtual time: jumps the manual clock to the deadline and returns.
class VirtualTimeSleeper : public Sleeper {
public:
    explicit VirtualTimeSleeper(std::shared_ptr<ManualClock> clock) : clock(std::move(clock)) {}

    Task<void> sleepUntil(Clock::TimePoint deadline, std::stop_token token) override {
        if (token.stop_requested()) {
            throw RateLimitCancelled();
        }
        deadlines.push_back(deadline);
        if (on_sleep) {
            on_sleep(deadline);
        }
        if (token.stop_requested()) {
            throw RateLimitCancelled();
        }
        clock->advanceTo(deadline);
        co_return;
    }

    std::vector<Clock::TimePoint> deadlines;
    std::function<void(Clock::TimePoint)> on_sleep;

private:
    std::shared_ptr<ManualClock> clock;
};

// Parks every sleeper until the test calls releaseAll(). Single-threaded use.
class GatedSleeper : public Sleeper {
public:
    struct GateAwaiter {
        GatedSleeper* sleeper;

        bool await_ready() const noexcept { return false; }
        void await_suspend(std::coroutine_handle<> handle) { sleeper->parked.push_back(handle); }
        void await_resume() const noexcept {}
    };

    Task<void> sleepUntil(Clock::TimePoint deadline, std::stop_token token) override {
        if (token.stop_requested()) {
            throw RateLimitCancelled();
        }
        deadlines.push_back(deadline);
        co_await GateAwaiter{this};
        if (token.stop_requested()) {
            throw RateLimitCancelled();
        }
    }

    void releaseAll() {
        // Resumed waiters may park again while we iterate.
        std::vector<std::coroutine_handle<>> handles;
        handles.swap(parked);
        for (std::coroutine_handle<> handle : handles) {
            handle.resume();
        }
    }

    size_t parkedCount() const { return parked.size(); }

    std::vector<Clock::TimePoint> deadlines;

private:
    std::vector<std::coroutine_handle<>> parked;
};

// Largest number of instants in any trailing window (t - window, t].
inline size_t maxInTrailingWindow(const std::vector<Clock::TimePoint>& times, Clock::Duration window) {
    size_t worst = 0;
    for (Clock::TimePoint t : times) {
        size_t count = 0;
        for (Clock::TimePoint other : times) {
            if (other > t - window && other <= t) {
                ++count;
            }
        }
        worst = std::max(worst, count);
    }
    return worst;
}

#endif
