#pragma once
/** @file  RecoveryCoordinator.hpp
 *  @brief Boot-time reconciliation: persisted rows → scheduler waits.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <memory>

namespace chime {
  namespace core {

    class AlarmRepository;
    class AlarmScheduler;
    class Clock;
    class ErrorMonitor;
    class Logger;

    /**
 * @class RecoveryCoordinator
 * @brief Re-registers every active, unfired alarm with a fresh scheduler.
 *
 *  * Idempotent: ids that already have a live wait are left alone, so a
 *    second pass leaves the same waits and never doubles a delivery.
 *  * Rows the overdue policy rejects are skipped and reported, not fatal.
 */
    class RecoveryCoordinator {
    public:
      RecoveryCoordinator(AlarmRepository& repository, AlarmScheduler& scheduler, Clock& clock,
                          std::shared_ptr<ErrorMonitor> errorMonitor,
                          std::shared_ptr<Logger> logger);

      /// @returns number of alarms registered by this pass.
      std::size_t recover();

    private:
      AlarmRepository& repository_;
      AlarmScheduler& scheduler_;
      Clock& clock_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> logger_;
    };

  } // namespace core
} // namespace chime
