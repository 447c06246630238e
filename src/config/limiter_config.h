#ifndef LIMITER_CONFIG_H
#define LIMITER_CONFIG_H

#include "../clock/clock.h"
#include "../rate_limiter/rate_limit_rule.h"
#include <json/json.h>
#include <trantor/utils/Logger.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct RuleConfig {
    int64_t limit;
    Clock::Duration window;
};

struct LimiterConfig {
    std::vector<RuleConfig> rules;
    trantor::Logger::LogLevel log_level = trantor::Logger::kInfo;
    int32_t requests = 20;
};

// Throws RateLimitConfigError naming the offending field.
LimiterConfig loadLimiterConfig(const Json::Value& root);
LimiterConfig loadLimiterConfigFile(const std::string& path);

std::vector<std::shared_ptr<RateLimitRule>> makeRules(const LimiterConfig& config,
                                                      std::shared_ptr<Clock> clock = SteadyClock::instance());

#endif
