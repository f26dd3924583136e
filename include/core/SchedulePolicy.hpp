#pragma once
/** @file  SchedulePolicy.hpp
 *  @brief Tunables for overdue registrations and delivery retries.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>

namespace chime {
  namespace core {

    /// What `AlarmScheduler::registerAlarm` does with a target instant that is not in the future.
    enum class OverduePolicy : std::uint8_t { FireImmediately, Reject };

    inline const char* toString(OverduePolicy p) {
      switch (p) {
      case OverduePolicy::FireImmediately:
        return "fire_immediately";
      case OverduePolicy::Reject:
        return "reject";
      default:
        return "unknown";
      }
    }

    /**
 * @struct RetryPolicy
 * @brief Bounded exponential backoff between notifier attempts.
 *
 *  * `maxAttempts` counts the first try, so 1 means "never retry".
 *  * Delay before attempt n+1 = min(initialBackoff * multiplier^(n-1), maxBackoff).
 */
    struct RetryPolicy {
      unsigned maxAttempts{ 5 };
      std::chrono::milliseconds initialBackoff{ 500 };
      double backoffMultiplier{ 2.0 };
      std::chrono::milliseconds maxBackoff{ 10000 };

      /// Delay to wait after the \p failedAttempt-th failure (1-based).
      std::chrono::milliseconds delayAfter(unsigned failedAttempt) const;
    };

  } // namespace core
} // namespace chime
