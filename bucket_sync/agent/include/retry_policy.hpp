#pragma once

#include "object_store.hpp"

#include <chrono>
#include <functional>
#include <thread>
#include <utility>

namespace bucket_sync::agent {

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{5000};

    // Exponential backoff after the given (1-based) failed attempt.
    std::chrono::milliseconds delay_for(int attempt) const;
};

using RetryListener = std::function<void(int attempt, const RemoteError& error, std::chrono::milliseconds delay)>;

// Runs `operation` until it succeeds, it throws an error that is not a
// retryable RemoteError, or the policy's attempt budget is exhausted. The
// last error is rethrown unchanged.
template <typename Operation>
auto with_retry(const RetryPolicy& policy, Operation&& operation, const RetryListener& on_retry = {})
    -> decltype(operation()) {
    for (int attempt = 1;; ++attempt) {
        try {
            return operation();
        } catch (const RemoteError& error) {
            if (!error.retryable() || attempt >= policy.max_attempts) {
                throw;
            }
            const auto delay = policy.delay_for(attempt);
            if (on_retry) {
                on_retry(attempt, error, delay);
            }
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
        }
    }
}

}  // namespace bucket_sync::agent
