#include <drogon/drogon.h>
#include <trantor/net/EventLoopThread.h>
#include "config/limiter_config.h"
#include "rate_limiter/rate_limiter.h"
#include "scheduler/sleeper.h"
#include <latch>

// Same rules as the API client this limiter was written for.
LimiterConfig defaultConfig() {
    LimiterConfig config;
    config.rules.push_back({3, std::chrono::seconds(5)});
    config.rules.push_back({10, std::chrono::minutes(1)});
    return config;
}

int32_t main(int32_t argc, char* argv[]) {
    LimiterConfig config;
    std::vector<std::shared_ptr<RateLimitRule>> rules;
    try {
        config = argc > 1 ? loadLimiterConfigFile(argv[1]) : defaultConfig();
        rules = makeRules(config);
    } catch (const RateLimitConfigError& e) {
        LOG_ERROR << e.what();
        return 1;
    }
    trantor::Logger::setLogLevel(config.log_level);

    trantor::EventLoopThread loop_thread("RateLimitLoop");
    loop_thread.run();
    trantor::EventLoop* loop = loop_thread.getLoop();

    auto api = std::make_shared<RateGate<int32_t>>(
        [loop](int32_t request_id) -> Task<void> {
            LOG_INFO << "Executing request #" << request_id;
            co_await drogon::sleepCoro(loop, std::chrono::milliseconds(50));
        },
        std::move(rules), std::make_shared<EventLoopSleeper>(loop));

    std::latch done(config.requests);
    for (int32_t i = 0; i < config.requests; ++i) {
        drogon::async_run([api, i, &done]() -> Task<void> {
            try {
                co_await api->perform(i);
            } catch (const std::exception& e) {
                LOG_ERROR << "Request #" << i << " failed: " << e.what();
            }
            done.count_down();
        });
    }

    done.wait();
    LOG_INFO << "All " << config.requests << " requests completed";
    return 0;
}
