#ifndef RATE_LIMIT_ERRORS_H
#define RATE_LIMIT_ERRORS_H

#include <stdexcept>
#include <string>

// Bad rule, limiter or config values. Raised before any waiting happens.
class RateLimitConfigError : public std::invalid_argument {
public:
    explicit RateLimitConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// A perform() call was cancelled while waiting. Nothing was committed.
class RateLimitCancelled : public std::runtime_error {
public:
    RateLimitCancelled() : std::runtime_error("rate limit wait cancelled") {}
};

#endif
