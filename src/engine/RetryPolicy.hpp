#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string_view>

namespace mp::engine
{

struct RetryPolicy
{
    int max_attempts = 5;
    std::chrono::milliseconds initial_delay{200};
    double multiplier = 2.0;
    std::chrono::milliseconds max_delay{5'000};

    // Delay before retry number `attempt` (1-based: the wait after the first
    // failed attempt is delay_for(1)).
    std::chrono::milliseconds delay_for(int attempt) const;

    static RetryPolicy exponential(int attempts,
                                   std::chrono::milliseconds initial,
                                   double factor = 2.0,
                                   std::chrono::milliseconds cap =
                                       std::chrono::milliseconds{5'000});
    static RetryPolicy fixed(int attempts, std::chrono::milliseconds delay);
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Runs `attempt` until it returns true, the attempts run out, or `cancel`
// becomes true. An exception thrown by `attempt` counts as a failed attempt.
// The terminal failure is logged once under `what`.
bool retry_with_policy(RetryPolicy const &policy, std::string_view what,
                       std::function<bool()> const &attempt,
                       std::atomic<bool> const *cancel = nullptr,
                       Sleeper const &sleeper = {});

} // namespace mp::engine
