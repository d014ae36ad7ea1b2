#ifndef RETRY_POLICY_HPP
#define RETRY_POLICY_HPP

#include "Errors.hpp"
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <thread>

struct RetryPolicy
{
    size_t maxAttempts = 3;
    std::chrono::milliseconds baseDelay = std::chrono::milliseconds(100);
    std::chrono::milliseconds maxDelay = std::chrono::milliseconds(2000);

    // Delay slept after the given failed attempt (1-based): base * 2^(attempt-1), capped
    std::chrono::milliseconds delayAfter(size_t attempt) const
    {
        size_t shift = std::min<size_t>(attempt - 1, 20);
        std::chrono::milliseconds delay = baseDelay * (1LL << shift);
        return std::min(delay, maxDelay);
    }
};

// Runs f until it returns, retrying on StorageError with exponential backoff.
// The last StorageError is rethrown once maxAttempts attempts have failed.
template <typename Func>
auto retryWithBackoff(const RetryPolicy &policy, Func &&f)
{
    for (size_t attempt = 1;; ++attempt)
    {
        try
        {
            return f();
        }
        catch (const StorageError &)
        {
            if (attempt >= policy.maxAttempts)
                throw;
            std::this_thread::sleep_for(policy.delayAfter(attempt));
        }
    }
}

#endif
