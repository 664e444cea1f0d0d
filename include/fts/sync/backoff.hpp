#pragma once

#include "fts/core/config.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

namespace fts::sync {

/**
 * @brief Retry budget for transient failures
 *
 * Attempt n (1-based) that fails transiently is retried after unit * 2^n:
 * 2s, 4s, 8s with the default one-second unit. The failure after the last
 * retry parks the item as Failed with retry_count == max_retries.
 */
struct RetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds unit{1000};

    static RetryPolicy from_config(const SyncConfig& config) {
        return RetryPolicy{config.max_retries, config.backoff_unit};
    }

    /**
     * @brief Delay before the next attempt, or nullopt when retries are exhausted
     * @param retry_count retries already scheduled for the item before this failure
     */
    [[nodiscard]] std::optional<std::chrono::milliseconds> next_delay(int retry_count) const noexcept {
        if (retry_count >= max_retries) {
            return std::nullopt;
        }
        return backoff_delay(retry_count + 1);
    }

    [[nodiscard]] std::chrono::milliseconds backoff_delay(int retry_count) const noexcept {
        return unit * (std::int64_t{1} << retry_count);
    }
};

} // namespace fts::sync
