#pragma once

#include <spdlog/spdlog.h>

#include <cstdint>
#include <string_view>
#include <utility>

#include "Clock.hpp"
#include "Errors.hpp"
#include "config.hpp"

namespace ferry {

/**
 * @brief Runs `fn(attempt)` until it succeeds, a non-retryable FerryError is
 * thrown, or `retry.max_attempts` is reached. Sleeps with exponential backoff
 * between attempts. `on_retry(attempt, error)` runs before each sleep.
 */
template <typename Fn, typename OnRetry>
auto RetryWithBackoff(const RetryConfig& retry, Clock& clock, std::string_view what, Fn&& fn,
                      OnRetry&& on_retry) {
    for (std::uint32_t attempt = 1;; ++attempt) {
        try {
            return fn(attempt);
        } catch (const FerryError& e) {
            if (!e.retryable() || attempt >= retry.max_attempts) {
                throw;
            }
            const auto delay = retry.BackoffAfter(attempt);
            spdlog::warn("{} failed (attempt {}/{}): {}. Retrying in {} ms", what, attempt,
                         retry.max_attempts, e.what(), delay.count());
            on_retry(attempt, e);
            clock.SleepFor(delay);
        }
    }
}

template <typename Fn>
auto RetryWithBackoff(const RetryConfig& retry, Clock& clock, std::string_view what, Fn&& fn) {
    return RetryWithBackoff(retry, clock, what, std::forward<Fn>(fn),
                            [](std::uint32_t, const FerryError&) {});
}

}  // namespace ferry
