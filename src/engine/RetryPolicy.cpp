#include "engine/RetryPolicy.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <thread>

namespace mp::engine
{

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const
{
    if (attempt < 1)
    {
        attempt = 1;
    }
    double scaled = static_cast<double>(initial_delay.count()) *
                    std::pow(std::max(multiplier, 1.0), attempt - 1);
    double cap = static_cast<double>(max_delay.count());
    if (max_delay.count() > 0 && scaled > cap)
    {
        scaled = cap;
    }
    return std::chrono::milliseconds(static_cast<long long>(scaled));
}

RetryPolicy RetryPolicy::exponential(int attempts,
                                     std::chrono::milliseconds initial,
                                     double factor,
                                     std::chrono::milliseconds cap)
{
    return RetryPolicy{attempts, initial, factor, cap};
}

RetryPolicy RetryPolicy::fixed(int attempts, std::chrono::milliseconds delay)
{
    return RetryPolicy{attempts, delay, 1.0, delay};
}

bool retry_with_policy(RetryPolicy const &policy, std::string_view what,
                       std::function<bool()> const &attempt,
                       std::atomic<bool> const *cancel,
                       Sleeper const &sleeper)
{
    auto cancelled = [cancel]
    { return cancel != nullptr && cancel->load(std::memory_order_acquire); };

    int const attempts = std::max(policy.max_attempts, 1);
    for (int current = 1; current <= attempts; ++current)
    {
        if (cancelled())
        {
            MP_LOG_DEBUG("{}: cancelled before attempt {}", what, current);
            return false;
        }
        try
        {
            if (attempt())
            {
                if (current > 1)
                {
                    MP_LOG_DEBUG("{}: succeeded on attempt {}", what, current);
                }
                return true;
            }
        }
        catch (std::exception const &ex)
        {
            MP_LOG_DEBUG("{}: attempt {} threw: {}", what, current, ex.what());
        }
        if (current == attempts)
        {
            break;
        }
        auto delay = policy.delay_for(current);
        if (sleeper)
        {
            sleeper(delay);
        }
        else
        {
            std::this_thread::sleep_for(delay);
        }
    }
    if (cancelled())
    {
        return false;
    }
    MP_LOG_WARN("{}: giving up after {} attempts", what, attempts);
    return false;
}

} // namespace mp::engine
