#include "rate_limit_rule.h"
#include "errors.h"
#include <trantor/utils/Logger.h>
#include <algorithm>

RateLimitRule::RateLimitRule(int64_t limit, Clock::Duration window, std::shared_ptr<Clock> clock)
    : max_requests(limit), window_duration(window), clock(std::move(clock)) {
    if (max_requests <= 0) {
        throw RateLimitConfigError("rate limit rule: limit must be positive, got " +
                                   std::to_string(max_requests));
    }
    if (window_duration <= Clock::Duration::zero()) {
        throw RateLimitConfigError("rate limit rule: window must be positive");
    }
    if (!this->clock) {
        throw RateLimitConfigError("rate limit rule: clock is required");
    }
    LOG_DEBUG << "Rate limit rule created: " << max_requests << " per "
              << std::chrono::duration_cast<std::chrono::milliseconds>(window_duration).count() << "ms";
}

void RateLimitRule::evictExpired(Clock::TimePoint now) {
    // An entry exactly one window old is already outside (now - window, now].
    Clock::TimePoint cutoff = now - window_duration;
    while (!timestamps.empty() && timestamps.front() <= cutoff) {
        timestamps.pop_front();
    }
}

AdmitResult RateLimitRule::admitLocked(Clock::TimePoint now) {
    evictExpired(now);

    int64_t count = static_cast<int64_t>(timestamps.size());
    if (count < max_requests) {
        return {AdmitStatus::Available, now};
    }

    // The entry at count - limit is the one whose expiry brings the count
    // below limit; without over-commitment that is the oldest entry.
    Clock::TimePoint blocking = timestamps[static_cast<size_t>(count - max_requests)];
    Clock::TimePoint ready_at = blocking + window_duration;
    LOG_TRACE << "Rate limit rule busy: " << count << "/" << max_requests << ", free in "
              << std::chrono::duration_cast<std::chrono::milliseconds>(ready_at - now).count() << "ms";
    return {AdmitStatus::Busy, ready_at};
}

AdmitResult RateLimitRule::tryAdmit() {
    std::lock_guard<std::mutex> lock(timestamps_mutex);
    return admitLocked(clock->now());
}

AdmitResult RateLimitRule::tryAdmit(Clock::TimePoint now) {
    std::lock_guard<std::mutex> lock(timestamps_mutex);
    return admitLocked(now);
}

void RateLimitRule::commit(Clock::TimePoint timestamp) {
    std::lock_guard<std::mutex> lock(timestamps_mutex);
    // Racing callers can commit out of grant order; keep the history sorted.
    auto pos = std::upper_bound(timestamps.begin(), timestamps.end(), timestamp);
    timestamps.insert(pos, timestamp);
}

std::vector<Clock::TimePoint> RateLimitRule::history() const {
    std::lock_guard<std::mutex> lock(timestamps_mutex);
    return {timestamps.begin(), timestamps.end()};
}

