#include "../src/scheduler/sleeper.h"
#include "../src/rate_limiter/errors.h"
#include <gtest/gtest.h>
#include <trantor/net/EventLoopThread.h>
#include <future>
#include <thread>

using namespace std::chrono_literals;

class EventLoopSleeperTest : public ::testing::Test {
protected:
    void SetUp() override {
        loop_thread.run();
        sleeper = std::make_shared<EventLoopSleeper>(loop_thread.getLoop(), clock);
    }

    trantor::EventLoopThread loop_thread;
    std::shared_ptr<Clock> clock = SteadyClock::instance();
    std::shared_ptr<EventLoopSleeper> sleeper;
};

TEST_F(EventLoopSleeperTest, RequiresLoopAndClock) {
    EXPECT_THROW(EventLoopSleeper(nullptr, clock), RateLimitConfigError);
    EXPECT_THROW(EventLoopSleeper(loop_thread.getLoop(), nullptr), RateLimitConfigError);
}

TEST_F(EventLoopSleeperTest, WakesUpAtDeadline) {
    Clock::TimePoint start = clock->now();
    drogon::sync_wait(sleeper->sleepUntil(start + 50ms, {}));
    EXPECT_GE(clock->now() - start, 45ms);
}

TEST_F(EventLoopSleeperTest, PastDeadlineStillYields) {
    Clock::TimePoint start = clock->now();
    EXPECT_NO_THROW(drogon::sync_wait(sleeper->sleepUntil(start - 1s, {})));
    EXPECT_LT(clock->now() - start, 1s);
}

TEST_F(EventLoopSleeperTest, StoppedTokenThrowsWithoutSleeping) {
    std::stop_source source;
    source.request_stop();

    Clock::TimePoint start = clock->now();
    EXPECT_THROW(drogon::sync_wait(sleeper->sleepUntil(start + 10s, source.get_token())), RateLimitCancelled);
    EXPECT_LT(clock->now() - start, 1s);
}

TEST_F(EventLoopSleeperTest, StopInterruptsArmedTimer) {
    std::stop_source source;
    Clock::TimePoint start = clock->now();

    std::future<void> waiting = std::async(std::launch::async, [&]() {
        drogon::sync_wait(sleeper->sleepUntil(start + 10s, source.get_token()));
    });
    std::this_thread::sleep_for(30ms);
    source.request_stop();

    EXPECT_THROW(waiting.get(), RateLimitCancelled);
    EXPECT_LT(clock->now() - start, 5s);
}

TEST_F(EventLoopSleeperTest, StopAfterWakeUpIsHarmless) {
    std::stop_source source;
    drogon::sync_wait(sleeper->sleepUntil(clock->now() + 10ms, source.get_token()));
    source.request_stop();
    SUCCEED();
}
