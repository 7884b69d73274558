#pragma once

#include "common/errors.hpp"

#include <spdlog/spdlog.h>
#include <chrono>
#include <functional>
#include <string>
#include <thread>

namespace thisthat {

struct RetryOptions {
    int max_retries{2};                                   // attempts after the first
    std::chrono::milliseconds initial_delay{500};         // doubled after each failure
    std::function<void(std::chrono::milliseconds)> sleep; // empty = std::this_thread::sleep_for
};

/**
 * Runs op, retrying with exponential backoff while it throws
 * TransientStoreError. Any other exception propagates on the first throw; the
 * last transient error propagates once retries are exhausted.
 */
template <typename Op>
auto retry_with_backoff(const std::string& what, const RetryOptions& options, Op&& op)
    -> decltype(op())
{
    auto delay = options.initial_delay;
    for (int attempt = 0;; ++attempt) {
        try {
            return op();
        } catch (const TransientStoreError& e) {
            if (attempt >= options.max_retries) {
                spdlog::error("{} failed after {} attempts: {}", what, attempt + 1, e.what());
                throw;
            }
            spdlog::warn("{} hit a busy store (attempt {}/{}), retrying in {}ms: {}",
                         what, attempt + 1, options.max_retries + 1, delay.count(), e.what());
        }

        if (options.sleep) {
            options.sleep(delay);
        } else {
            std::this_thread::sleep_for(delay);
        }
        delay *= 2;
    }
}

} // namespace thisthat
