#pragma once
/** @file  AlarmService.hpp
 *  @brief API layer: create / list / delete / toggle, gated behind recovery.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Chime headers
#include "core/Alarm.hpp"

namespace chime {
  namespace core {

    class AlarmRepository;
    class AlarmScheduler;
    class Clock;
    class Logger;
    class NotifierGateway;
    class RecoveryCoordinator;

    /**
 * @class AlarmService
 * @brief What UI handlers call.  Persists first, then touches the scheduler.
 *
 *  * Installs the scheduler's fire handler (→ `AlarmRepository::markFired`).
 *  * `start()` runs recovery exactly once; every mutating call made before it
 *    throws `std::logic_error`.
 *  * Arming calls (`createAlarm`, `toggleAlarm(id, true)`) check notification
 *    permission first and throw `PermissionDenied` if it cannot be obtained.
 *  * Other failures surface as the typed errors in Errors.hpp.
 */
    class AlarmService {
    public:
      AlarmService(AlarmRepository& repository, AlarmScheduler& scheduler,
                   RecoveryCoordinator& recovery, std::shared_ptr<NotifierGateway> gateway,
                   Clock& clock, std::shared_ptr<Logger> logger);

      /// Runs recovery and opens the gate.  @returns alarms recovered (0 on repeat calls).
      std::size_t start();
      bool started() const { return started_.load(); }

      AlarmId createAlarm(const std::string& title, Instant at);
      std::vector<AlarmView> listAlarms() const;
      void deleteAlarm(AlarmId id);
      void toggleAlarm(AlarmId id, bool active);

    private:
      void requireStarted() const;
      void requirePermission();
      void note(AlarmId id, const char* event, const std::string& detail = {}) const;

      AlarmRepository& repository_;
      AlarmScheduler& scheduler_;
      RecoveryCoordinator& recovery_;
      std::shared_ptr<NotifierGateway> gateway_;
      Clock& clock_;
      std::shared_ptr<Logger> logger_;

      std::mutex startMtx_;
      std::atomic<bool> started_{ false };
    };

  } // namespace core
} // namespace chime
