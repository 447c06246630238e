#ifndef SLEEPER_H
#define SLEEPER_H

#include "../clock/clock.h"
#include <drogon/utils/coroutine.h>
#include <trantor/net/EventLoop.h>
#include <coroutine>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>

using namespace drogon;

// Cancellable sleep-until-instant. Implementations throw RateLimitCancelled
// when the token is stopped before or during the sleep.
class Sleeper {
public:
    virtual ~Sleeper() = default;
    virtual Task<void> sleepUntil(Clock::TimePoint deadline, std::stop_token token) = 0;
};

// Suspends on a trantor timer. The stop callback invalidates the timer and
// resumes the waiter on the loop, so an armed delay does not run to its end.
struct [[nodiscard]] CancellableTimerAwaiter {
    struct State {
        std::mutex mutex;
        bool done = false;
        bool cancelled = false;
        bool suspended = false;
        trantor::TimerId timer_id = trantor::InvalidTimerId;
        std::coroutine_handle<> handle;
    };

    CancellableTimerAwaiter(trantor::EventLoop* loop, std::chrono::duration<double> delay,
                            std::stop_token token)
        : loop(loop), delay(delay), token(std::move(token)), state(std::make_shared<State>()) {}

    bool await_ready() const noexcept { return false; }
    bool await_suspend(std::coroutine_handle<> handle);
    void await_resume();

private:
    trantor::EventLoop* loop;
    std::chrono::duration<double> delay;
    std::stop_token token;
    std::shared_ptr<State> state;
    std::optional<std::stop_callback<std::function<void()>>> stop_callback;
};

class EventLoopSleeper : public Sleeper {
public:
    // Stands in for a deadline that has already passed.
    static constexpr std::chrono::milliseconds kMinimalYield{1};

    EventLoopSleeper(trantor::EventLoop* loop, std::shared_ptr<Clock> clock = SteadyClock::instance());

    Task<void> sleepUntil(Clock::TimePoint deadline, std::stop_token token) override;

private:
    trantor::EventLoop* loop;
    std::shared_ptr<Clock> clock;
};

#endif
