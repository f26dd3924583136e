#pragma once
/** @file  Clock.hpp
 *  @brief Time source shared by the scheduler, the repository and the backoff loop.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stop_token>

// Chime headers
#include "core/Alarm.hpp"

namespace chime {
  namespace core {

    /**
 * @class Clock
 * @brief Abstract wall clock with a cancellable sleep.
 *
 *  * Every component that compares or stamps instants reads the same Clock.
 *  * Tests substitute a manually advanced clock.
 */
    class Clock {
    public:
      virtual ~Clock() = default;

      virtual Instant now() const = 0;

      /** Blocks until `now() >= deadline` or \p stop is requested.
       *  @returns true if the deadline was reached, false if stopped first. */
      virtual bool sleepUntil(Instant deadline, std::stop_token stop) = 0;
    };

    /// std::chrono::system_clock backed implementation.
    class SystemClock : public Clock {
    public:
      Instant now() const override;
      bool sleepUntil(Instant deadline, std::stop_token stop) override;
    };

  } // namespace core
} // namespace chime
