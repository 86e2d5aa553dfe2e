// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TESSERA_RETRY_HANDLER_HPP
#define TESSERA_RETRY_HANDLER_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace tessera {
namespace uploader {

/**
 * Configuration for part retry behavior
 */
struct RetryConfig {
  int max_attempts = 3;                           // Total attempts per part, first one included
  std::chrono::milliseconds initial_delay{2000};  // Delay after the first failure
  std::chrono::milliseconds max_delay{10000};     // Cap on the exponential term
  std::chrono::milliseconds max_jitter{500};      // Upper bound of the additive jitter
  bool jitter = true;                             // Add random jitter
};

/**
 * Retry handler with exponential backoff and additive jitter
 *
 * Delay after failed attempt n (1-based):
 *   min(initial_delay * 2^(n-1), max_delay) + uniform[0, max_jitter]
 *
 * Thread-safe: multiple threads can call getDelay() concurrently.
 */
class RetryHandler {
public:
  explicit RetryHandler(const RetryConfig& config = {})
      : config_(config)
      , rng_(std::random_device{}()) {}

  /**
   * Calculate delay before the next attempt
   *
   * @param attempt Attempt that just failed (1-based)
   * @return Delay duration before next attempt
   */
  std::chrono::milliseconds getDelay(int attempt) const {
    int exponent = std::max(0, attempt - 1);
    int64_t delay_ms = config_.initial_delay.count();
    const int64_t max_ms = config_.max_delay.count();

    // Doubling with an early stop avoids overflow for large attempt numbers
    for (int i = 0; i < exponent && delay_ms < max_ms; ++i) {
      delay_ms *= 2;
    }
    delay_ms = std::min(delay_ms, max_ms);

    if (config_.jitter && config_.max_jitter.count() > 0) {
      std::lock_guard<std::mutex> lock(rng_mutex_);
      std::uniform_int_distribution<int64_t> dist(0, config_.max_jitter.count());
      delay_ms += dist(rng_);
    }

    return std::chrono::milliseconds(std::max<int64_t>(delay_ms, 0));
  }

  /**
   * Check if another attempt should be made
   *
   * @param attempt Attempt that just failed (1-based)
   * @return true if attempt < max_attempts
   */
  bool shouldRetry(int attempt) const {
    return attempt < config_.max_attempts;
  }

  int maxAttempts() const {
    return config_.max_attempts;
  }

  const RetryConfig& config() const {
    return config_;
  }

private:
  RetryConfig config_;
  mutable std::mt19937_64 rng_;   // mutable for const getDelay()
  mutable std::mutex rng_mutex_;  // protects rng_ for thread-safe jitter
};

}  // namespace uploader
}  // namespace tessera

#endif  // TESSERA_RETRY_HANDLER_HPP
