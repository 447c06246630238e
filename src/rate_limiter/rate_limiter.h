#ifndef RATE_LIMITER_H
#define RATE_LIMITER_H

#include "rate_limit_rule.h"
#include "errors.h"
#include "../scheduler/sleeper.h"
#include <drogon/utils/coroutine.h>
#include <trantor/utils/Logger.h>
#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <vector>

using namespace drogon;

template <typename Arg>
concept NullableArgument = requires(const Arg& arg) {
    { arg == nullptr } -> std::convertible_to<bool>;
};

// Wraps an action with one or more rules. perform() waits until every rule
// has capacity, records the admission in all of them, then runs the action.
//
// No rule is charged until every rule has granted in the same probe pass, so
// a cancelled call leaves all histories untouched. Grants and commits are not
// one transaction: a concurrent call may commit between this call's probe and
// its commit, leaving a rule one entry over its limit per racing call until
// those entries expire. Commits are not re-validated.
//
// Waiters are not queued. Whoever probes first after a slot frees takes it,
// so a call can starve under sustained load.
template <typename Arg>
class RateGate {
public:
    using Action = std::function<Task<void>(Arg)>;
    using RulePtr = std::shared_ptr<RateLimitRule>;

    RateGate(Action action, std::vector<RulePtr> rules, std::shared_ptr<Sleeper> sleeper)
        : action(std::move(action)), rules(std::move(rules)), sleeper(std::move(sleeper)) {
        if (!this->action) {
            throw RateLimitConfigError("rate gate: action is required");
        }
        if (this->rules.empty()) {
            throw RateLimitConfigError("rate gate: at least one rate limit rule is required");
        }
        for (const RulePtr& rule : this->rules) {
            if (!rule) {
                throw RateLimitConfigError("rate gate: rule must not be null");
            }
        }
        if (!this->sleeper) {
            throw RateLimitConfigError("rate gate: sleeper is required");
        }
    }

    // Cancellation is honoured only while waiting. Once all rules have
    // granted, the call commits and runs the action regardless of the token.
    // Action errors are rethrown after the admission has been recorded.
    Task<void> perform(Arg arg, std::stop_token token = {}) {
        if constexpr (NullableArgument<Arg>) {
            if (arg == nullptr) {
                throw RateLimitConfigError("rate gate: argument must not be null");
            }
        }

        std::vector<Clock::TimePoint> granted = co_await waitForAllRules(token);

        for (size_t i = 0; i < rules.size(); ++i) {
            rules[i]->commit(granted[i]);
        }
        LOG_TRACE << "Admission committed to " << rules.size() << " rule(s)";

        co_await action(std::move(arg));
    }

    const std::vector<RulePtr>& getRules() const { return rules; }

private:
    Action action;
    const std::vector<RulePtr> rules;
    std::shared_ptr<Sleeper> sleeper;

    // Returns one granted instant per rule, all from the same probe pass.
    Task<std::vector<Clock::TimePoint>> waitForAllRules(std::stop_token token) {
        std::vector<Clock::TimePoint> granted(rules.size());
        while (true) {
            if (token.stop_requested()) {
                LOG_DEBUG << "Rate limited call cancelled before admission";
                throw RateLimitCancelled();
            }

            // Every rule must be free, so waiting for the latest ready time
            // covers all busy rules at once.
            std::optional<Clock::TimePoint> blocked_until;
            for (size_t i = 0; i < rules.size(); ++i) {
                AdmitResult result = rules[i]->tryAdmit();
                if (result.available()) {
                    granted[i] = result.at;
                } else if (!blocked_until || result.at > *blocked_until) {
                    blocked_until = result.at;
                }
            }
            if (!blocked_until) {
                co_return granted;
            }

            LOG_DEBUG << "Rate limit reached, waiting for a free slot";
            try {
                co_await sleeper->sleepUntil(*blocked_until, token);
            } catch (const RateLimitCancelled&) {
                LOG_DEBUG << "Rate limited call cancelled while waiting";
                throw;
            }
        }
    }
};

#endif
