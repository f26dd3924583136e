#pragma once
/** @file  Alarm.hpp
 *  @brief Persisted alarm entity and the per-activation state machine.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace chime {
  namespace core {

    using AlarmId = std::int64_t;
    using Instant = std::chrono::system_clock::time_point;

    /**
 * @struct Alarm
 * @brief One row of the alarm table, mapped to domain types.
 *
 *  * `id`, `title`, `scheduledTime` and `createdAt` never change after insert.
 *  * `firedAt` is written once, by the fire path only.
 */
    struct Alarm {
      AlarmId id{ 0 };
      std::string title;
      Instant scheduledTime{};
      bool isActive{ true };
      Instant createdAt{};
      std::optional<Instant> firedAt{};
    };

    /// Lifecycle of one activation. Fired, DeliveryFailed and Cancelled are terminal.
    enum class AlarmState : std::uint8_t {
      Pending,
      Due,
      Delivering,
      Fired,
      DeliveryFailed,
      Cancelled,
      Count
    };
    static_assert(static_cast<std::uint8_t>(AlarmState::Count) == 6,
                  "AlarmState count changed please update code that depends on it");

    inline const char* toString(AlarmState s) {
      switch (s) {
      case AlarmState::Pending:
        return "Pending";
      case AlarmState::Due:
        return "Due";
      case AlarmState::Delivering:
        return "Delivering";
      case AlarmState::Fired:
        return "Fired";
      case AlarmState::DeliveryFailed:
        return "DeliveryFailed";
      case AlarmState::Cancelled:
        return "Cancelled";
      default:
        return "Unknown";
      }
    }

    /// What the API layer hands to the UI: the row plus a derived status.
    struct AlarmView {
      Alarm alarm;
      AlarmState status{ AlarmState::Pending };
    };

  } // namespace core
} // namespace chime
