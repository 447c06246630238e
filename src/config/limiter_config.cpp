#include "limiter_config.h"
#include "../rate_limiter/errors.h"
#include <chrono>
#include <fstream>

namespace {

// Largest window a steady_clock duration can hold.
const int64_t kMaxWindowMs =
    std::chrono::duration_cast<std::chrono::milliseconds>(Clock::Duration::max()).count();
const double kMaxWindowSeconds = std::chrono::duration<double>(Clock::Duration::max()).count();

trantor::Logger::LogLevel parseLogLevel(const std::string& level) {
    if (level == "TRACE") return trantor::Logger::kTrace;
    if (level == "DEBUG") return trantor::Logger::kDebug;
    if (level == "INFO") return trantor::Logger::kInfo;
    if (level == "WARN") return trantor::Logger::kWarn;
    if (level == "ERROR") return trantor::Logger::kError;
    throw RateLimitConfigError("config: unknown log_level \"" + level + "\"");
}

RuleConfig parseRule(const Json::Value& rule, Json::ArrayIndex index) {
    std::string where = "config: rules[" + std::to_string(index) + "]";
    if (!rule.isObject()) {
        throw RateLimitConfigError(where + " must be an object");
    }

    const Json::Value& limit = rule["limit"];
    if (!limit.isInt64() || limit.asInt64() <= 0) {
        throw RateLimitConfigError(where + ".limit must be a positive integer");
    }

    bool has_ms = rule.isMember("window_ms");
    bool has_seconds = rule.isMember("window_seconds");
    if (has_ms == has_seconds) {
        throw RateLimitConfigError(where + " needs exactly one of window_ms, window_seconds");
    }

    Clock::Duration window{};
    if (has_ms) {
        const Json::Value& ms = rule["window_ms"];
        if (!ms.isInt64() || ms.asInt64() <= 0) {
            throw RateLimitConfigError(where + ".window_ms must be a positive integer");
        }
        if (ms.asInt64() > kMaxWindowMs) {
            throw RateLimitConfigError(where + ".window_ms is too large");
        }
        window = std::chrono::milliseconds(ms.asInt64());
    } else {
        const Json::Value& seconds = rule["window_seconds"];
        if (!seconds.isNumeric() || !(seconds.asDouble() > 0.0)) {
            throw RateLimitConfigError(where + ".window_seconds must be a positive number");
        }
        // The double nearest Duration::max() rounds up past it.
        if (seconds.asDouble() >= kMaxWindowSeconds) {
            throw RateLimitConfigError(where + ".window_seconds is too large");
        }
        window = std::chrono::duration_cast<Clock::Duration>(
            std::chrono::duration<double>(seconds.asDouble()));
    }
    return {limit.asInt64(), window};
}

}

LimiterConfig loadLimiterConfig(const Json::Value& root) {
    if (!root.isObject()) {
        throw RateLimitConfigError("config: top level must be an object");
    }

    LimiterConfig config;

    const Json::Value& rules = root["rules"];
    if (!rules.isArray() || rules.empty()) {
        throw RateLimitConfigError("config: rules must be a non-empty array");
    }
    for (Json::ArrayIndex i = 0; i < rules.size(); ++i) {
        config.rules.push_back(parseRule(rules[i], i));
    }

    if (root.isMember("log_level")) {
        if (!root["log_level"].isString()) {
            throw RateLimitConfigError("config: log_level must be a string");
        }
        config.log_level = parseLogLevel(root["log_level"].asString());
    }

    if (root.isMember("requests")) {
        const Json::Value& requests = root["requests"];
        if (!requests.isInt() || requests.asInt() <= 0) {
            throw RateLimitConfigError("config: requests must be a positive integer");
        }
        config.requests = requests.asInt();
    }

    return config;
}

LimiterConfig loadLimiterConfigFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw RateLimitConfigError("config: cannot open " + path);
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw RateLimitConfigError("config: " + path + ": " + errors);
    }
    LOG_INFO << "Loaded rate limit config from " << path;
    return loadLimiterConfig(root);
}

std::vector<std::shared_ptr<RateLimitRule>> makeRules(const LimiterConfig& config,
                                                      std::shared_ptr<Clock> clock) {
    std::vector<std::shared_ptr<RateLimitRule>> rules;
    rules.reserve(config.rules.size());
    for (const RuleConfig& rule : config.rules) {
        rules.push_back(std::make_shared<RateLimitRule>(rule.limit, rule.window, clock));
    }
    return rules;
}
