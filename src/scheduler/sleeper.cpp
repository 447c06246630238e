#include "sleeper.h"
#include "../rate_limiter/errors.h"
#include <trantor/utils/Logger.h>

bool CancellableTimerAwaiter::await_suspend(std::coroutine_handle<> handle) {
    state->handle = handle;

    // Registered before the timer is armed: if the token is already stopped
    // the callback runs right here and the timer is never armed.
    stop_callback.emplace(token, [state = state, loop = loop]() {
        trantor::TimerId timer_id = trantor::InvalidTimerId;
        bool resume = false;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->done) {
                return;
            }
            state->done = true;
            state->cancelled = true;
            timer_id = state->timer_id;
            resume = state->suspended;
        }
        if (timer_id != trantor::InvalidTimerId) {
            loop->invalidateTimer(timer_id);
        }
        if (resume) {
            loop->queueInLoop([handle = state->handle]() { handle.resume(); });
        }
    });

    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->done) {
        return false;
    }
    state->timer_id = loop->runAfter(delay, [state = state]() {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->done) {
                return;
            }
            state->done = true;
        }
        state->handle.resume();
    });
    state->suspended = true;
    return true;
}

void CancellableTimerAwaiter::await_resume() {
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->cancelled) {
        throw RateLimitCancelled();
    }
}

EventLoopSleeper::EventLoopSleeper(trantor::EventLoop* loop, std::shared_ptr<Clock> clock)
    : loop(loop), clock(std::move(clock)) {
    if (!this->loop) {
        throw RateLimitConfigError("event loop sleeper: loop is required");
    }
    if (!this->clock) {
        throw RateLimitConfigError("event loop sleeper: clock is required");
    }
}

Task<void> EventLoopSleeper::sleepUntil(Clock::TimePoint deadline, std::stop_token token) {
    if (token.stop_requested()) {
        throw RateLimitCancelled();
    }
    Clock::Duration delay = deadline - clock->now();
    if (delay <= Clock::Duration::zero()) {
        delay = kMinimalYield;
    }
    LOG_TRACE << "Sleeping " << std::chrono::duration_cast<std::chrono::microseconds>(delay).count() << "us";
    co_await CancellableTimerAwaiter(loop, delay, std::move(token));
}
