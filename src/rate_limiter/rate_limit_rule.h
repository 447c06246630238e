#ifndef RATE_LIMIT_RULE_H
#define RATE_LIMIT_RULE_H

#include "../clock/clock.h"
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

enum class AdmitStatus {
    Available,
    Busy
};

struct AdmitResult {
    AdmitStatus status;
    // Granted instant when Available, earliest instant a slot frees up when Busy.
    Clock::TimePoint at;

    bool available() const { return status == AdmitStatus::Available; }
};

// "At most limit occurrences within the trailing window (now - window, now]."
//
// tryAdmit() only reports capacity; the caller records the admission later
// with commit(). Both run under the rule's own mutex, but not as one critical
// section, so concurrent callers may briefly push the history past limit.
class RateLimitRule {
private:
    const int64_t max_requests;
    const Clock::Duration window_duration;
    std::shared_ptr<Clock> clock;
    std::deque<Clock::TimePoint> timestamps;
    mutable std::mutex timestamps_mutex;

    void evictExpired(Clock::TimePoint now);
    AdmitResult admitLocked(Clock::TimePoint now);

public:
    RateLimitRule(int64_t limit, Clock::Duration window,
                  std::shared_ptr<Clock> clock = SteadyClock::instance());

    RateLimitRule(const RateLimitRule&) = delete;
    RateLimitRule& operator=(const RateLimitRule&) = delete;

    // Reads the clock inside the lock.
    AdmitResult tryAdmit();
    AdmitResult tryAdmit(Clock::TimePoint now);

    void commit(Clock::TimePoint timestamp);

    int64_t limit() const { return max_requests; }
    Clock::Duration window() const { return window_duration; }

    // Oldest first. Not evicted; may hold expired entries until the next check.
    std::vector<Clock::TimePoint> history() const;
};

#endif
