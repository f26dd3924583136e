#pragma once
/** @file  AlarmStore.hpp
 *  @brief Abstract durable CRUD over alarm rows (no scheduling knowledge).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <vector>

// Chime headers
#include "core/Alarm.hpp"

namespace chime {
  namespace io {

    /**
 * @class AlarmStore
 * @brief Row store the repository sits on.
 *
 *  * Mutators return false when the id does not exist.
 *  * Storage failures (I/O, corrupt rows) throw `std::runtime_error`.
 *  * Implementations must be safe to call from scheduler worker threads.
 */
    class AlarmStore {
    public:
      virtual ~AlarmStore() = default;

      /// New row with is_active = 1 and fired_at = NULL; returns the assigned id.
      virtual core::AlarmId insert(const std::string& title, core::Instant scheduledTime,
                                   core::Instant createdAt) = 0;

      /// All rows ordered by id.
      virtual std::vector<core::Alarm> list() = 0;

      virtual std::optional<core::Alarm> find(core::AlarmId id) = 0;

      virtual bool remove(core::AlarmId id) = 0;
      virtual bool updateActive(core::AlarmId id, bool active) = 0;
      /// Stamps `fired_at` once; false when the row is missing or already fired.
      virtual bool updateFired(core::AlarmId id, core::Instant firedAt) = 0;
    };

  } // namespace io
} // namespace chime
