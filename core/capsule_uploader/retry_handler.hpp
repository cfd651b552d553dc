// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_RETRY_HANDLER_HPP
#define CAPSULE_RETRY_HANDLER_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace capsule {
namespace uploader {

/**
 * Configuration for per-chunk retry behavior
 */
struct RetryConfig {
  int max_attempts = 5;                       // Total attempts, first one included
  std::chrono::milliseconds delay_step{500};  // Delay grows by this much per failed attempt
  std::chrono::milliseconds max_delay{30000};
};

/**
 * Retry schedule with linear backoff
 *
 * After the n-th failed attempt (1-indexed) the caller waits
 * delay_step * n before trying again, capped at max_delay. The handler is
 * stateless and can be shared between threads.
 */
class RetryHandler {
public:
  explicit RetryHandler(const RetryConfig& config = {})
      : config_(config) {}

  /**
   * Delay to wait after a failed attempt
   *
   * @param attempt The attempt that just failed (1-indexed)
   */
  std::chrono::milliseconds getDelay(int attempt) const {
    const int64_t step = config_.delay_step.count();
    const int64_t delay_ms = step * std::max(attempt, 1);
    return std::chrono::milliseconds(std::min<int64_t>(delay_ms, config_.max_delay.count()));
  }

  /**
   * Check if another attempt is allowed after attempt number `attempt` failed
   */
  bool shouldRetry(int attempt) const {
    return attempt < config_.max_attempts;
  }

  int maxAttempts() const {
    return config_.max_attempts;
  }

  /**
   * Get configuration
   */
  const RetryConfig& config() const {
    return config_;
  }

private:
  RetryConfig config_;
};

}  // namespace uploader
}  // namespace capsule

#endif  // CAPSULE_RETRY_HANDLER_HPP
