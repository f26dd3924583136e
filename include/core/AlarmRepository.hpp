#pragma once
/** @file  AlarmRepository.hpp
 *  @brief Typed façade over the alarm store; sole writer of fired_at / is_active.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Chime headers
#include "core/Alarm.hpp"

namespace chime {
  namespace io {
    class AlarmStore;
  } // namespace io

  namespace core {

    class Clock;

    /**
 * @class AlarmRepository
 * @brief Maps store rows to `Alarm` and turns "row missing" into `NotFound`.
 *
 *  * Owns persisted identity; owns no timers.
 *  * `markFired` / `setActive` are the lifecycle mutators.  Keeping the
 *    scheduler in step with them is the caller's job.
 */
    class AlarmRepository {
    public:
      AlarmRepository(std::shared_ptr<io::AlarmStore> store, Clock& clock);

      /// Persists a new active alarm.  Throws `InvalidSchedule` on an empty title.
      Alarm create(const std::string& title, Instant scheduledTime);

      std::vector<Alarm> list() const;

      /// Rows with is_active = true and no fired_at, i.e. work recovery must re-register.
      std::vector<Alarm> listRecoverable() const;

      /// @throws NotFound
      Alarm get(AlarmId id) const;
      std::optional<Alarm> find(AlarmId id) const;

      /// @throws NotFound
      void remove(AlarmId id);

      /// Stamps fired_at with the clock's current instant.
      /// @throws NotFound when the row is gone or already stamped
      Instant markFired(AlarmId id);

      /// @throws NotFound
      void setActive(AlarmId id, bool active);

    private:
      std::shared_ptr<io::AlarmStore> store_;
      Clock& clock_;
    };

  } // namespace core
} // namespace chime
