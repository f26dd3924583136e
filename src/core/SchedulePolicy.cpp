/* @file SchedulePolicy.cpp
 * @brief backoff arithmetic for RetryPolicy
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>

// Chime headers
#include "core/SchedulePolicy.hpp"

using namespace chime::core;

std::chrono::milliseconds RetryPolicy::delayAfter(unsigned failedAttempt) const {
  if (failedAttempt == 0)
    return std::chrono::milliseconds{ 0 };

  const double scaled = static_cast<double>(initialBackoff.count()) *
                        std::pow(backoffMultiplier, static_cast<double>(failedAttempt - 1));
  const double capped = std::min(scaled, static_cast<double>(maxBackoff.count()));
  return std::chrono::milliseconds{ static_cast<std::chrono::milliseconds::rep>(capped) };
}
