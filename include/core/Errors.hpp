#pragma once
/** @file  Errors.hpp
 *  @brief Typed exceptions thrown across the engine's API boundary.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

// Chime headers
#include "core/Alarm.hpp"

namespace chime {
  namespace core {

    /// Common base so callers can catch every engine error in one place.
    class AlarmError : public std::runtime_error {
    public:
      explicit AlarmError(const std::string& message) : std::runtime_error(message) {}
    };

    /// Malformed definition or a target instant rejected by the overdue policy.
    class InvalidSchedule : public AlarmError {
    public:
      explicit InvalidSchedule(const std::string& message) : AlarmError(message) {}
    };

    class NotFound : public AlarmError {
    public:
      explicit NotFound(AlarmId id)
          : AlarmError("alarm " + std::to_string(id) + " not found"), id_(id) {}

      AlarmId id() const { return id_; }

    private:
      AlarmId id_;
    };

    /// One failed notifier call. Transient; the scheduler retries it.
    class DeliveryError : public AlarmError {
    public:
      explicit DeliveryError(const std::string& message) : AlarmError(message) {}
    };

    /// Retries exhausted for an activation.
    class DeliveryFailed : public AlarmError {
    public:
      DeliveryFailed(AlarmId id, const std::string& reason)
          : AlarmError("alarm " + std::to_string(id) + " delivery failed: " + reason), id_(id) {}

      AlarmId id() const { return id_; }

    private:
      AlarmId id_;
    };

    class PermissionDenied : public AlarmError {
    public:
      explicit PermissionDenied(const std::string& message) : AlarmError(message) {}
    };

  } // namespace core
} // namespace chime
