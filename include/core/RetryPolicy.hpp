#pragma once
/** @file  RetryPolicy.hpp
 *  @brief Bounded retry with exponential backoff for one fan-out target.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>
#include <chrono>

namespace carpark::core {

  struct RetryPolicy {
    int attempts{ 3 };                          ///< total tries per snapshot, >= 1
    std::chrono::milliseconds baseDelay{ 200 }; ///< wait after the first failure
    std::chrono::milliseconds maxDelay{ 5000 }; ///< backoff ceiling
    std::chrono::milliseconds timeout{ 3000 };  ///< per-attempt bound

    /// Delay before retry number \p failedAttempts (1-based): base * 2^(n-1), capped.
    std::chrono::milliseconds backoff(int failedAttempts) const {
      auto delay = baseDelay;
      for (int i = 1; i < failedAttempts && delay < maxDelay; ++i)
        delay *= 2;
      return std::min(delay, maxDelay);
    }
  };

} // namespace carpark::core
