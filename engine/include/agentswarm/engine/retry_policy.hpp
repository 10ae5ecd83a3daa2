#pragma once

#include "agentswarm/engine/errors.hpp"
#include <algorithm>
#include <cstdint>

namespace agentswarm {
namespace engine {

/**
 * Exponential backoff for recoverable failures
 *
 * Used for:
 * - capacity errors when distributing tasks (mailbox full)
 * - transient completion backend failures (transport errors, HTTP 429/5xx)
 */
class RetryPolicy {
public:
    struct Config {
        int64_t base_delay_ms = 100;      // Base delay for exponential backoff
        int64_t max_delay_ms = 5000;      // Maximum delay between retries
        int64_t total_timeout_ms = 30000; // Total time budget across all retries
        int32_t max_retries = 3;          // Maximum number of retries
    };

    RetryPolicy(const Config& config = Config()) : config_(config) {}

    /**
     * Delay before retry `attempt` (0-based): base * 2^attempt, capped at max_delay_ms
     */
    int64_t calculate_backoff_delay(int32_t attempt) const {
        if (attempt < 0) {
            attempt = 0;
        }
        if (attempt > 30) {
            return config_.max_delay_ms;
        }
        int64_t delay = config_.base_delay_ms * (1LL << attempt);
        return std::min(delay, config_.max_delay_ms);
    }

    /**
     * Retryable:
     * - mailbox_full (capacity, consumer will drain)
     * - completion_failed (transport level failure)
     * - HTTP 429 and 5xx
     *
     * Non-retryable: lifecycle errors, registry errors, other 4xx
     */
    bool is_retryable(const caf::error& err, int http_status_code = 0) const {
        if (http_status_code > 0) {
            if (http_status_code == 429) {
                return true;
            }
            if (http_status_code >= 400 && http_status_code < 500) {
                return false;
            }
            if (http_status_code >= 500) {
                return true;
            }
        }

        return is(err, swarm_errc::mailbox_full)
            || is(err, swarm_errc::completion_failed);
    }

    /**
     * True if the time already spent, plus the next backoff, exceeds the total budget
     */
    bool is_budget_exhausted(int64_t total_elapsed_ms, int32_t attempt) const {
        if (total_elapsed_ms >= config_.total_timeout_ms) {
            return true;
        }
        return total_elapsed_ms + calculate_backoff_delay(attempt) >= config_.total_timeout_ms;
    }

    int32_t max_retries() const {
        return config_.max_retries;
    }

    int64_t total_timeout_ms() const {
        return config_.total_timeout_ms;
    }

private:
    Config config_;
};

} // namespace engine
} // namespace agentswarm
