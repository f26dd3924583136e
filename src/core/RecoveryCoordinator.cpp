/* @file RecoveryCoordinator.cpp
 * @brief rebuilds the in-memory schedule from the alarm table
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>
#include <string>

#include "core/AlarmRepository.hpp"
#include "core/AlarmScheduler.hpp"
#include "core/Clock.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/RecoveryCoordinator.hpp"
#include "core/TimeUtil.hpp"

using namespace chime::core;

RecoveryCoordinator::RecoveryCoordinator(AlarmRepository& repository, AlarmScheduler& scheduler,
                                         Clock& clock, std::shared_ptr<ErrorMonitor> errorMonitor,
                                         std::shared_ptr<Logger> logger)
    : repository_(repository), scheduler_(scheduler), clock_(clock),
      errorMonitor_(std::move(errorMonitor)), logger_(std::move(logger)) {
  if (!errorMonitor_)
    throw std::invalid_argument("[RecoveryCoordinator] error monitor is nullptr");
}

std::size_t RecoveryCoordinator::recover() {
  std::size_t registered = 0;

  for (const Alarm& alarm : repository_.listRecoverable()) {
    if (scheduler_.isPending(alarm.id))
      continue; // a live wait (possibly mid-delivery) already covers this row

    try {
      scheduler_.registerAlarm(alarm.id, alarm.title, alarm.scheduledTime);
      ++registered;
      if (logger_)
        logger_->log({ clock_.now(), alarm.id, "recovered",
                       formatUtc(alarm.scheduledTime) });
    } catch (const InvalidSchedule& e) {
      // Reject policy: an overdue row stays active in the store and is reported
      if (logger_)
        logger_->log({ clock_.now(), alarm.id, "recovery_skipped", e.what() });
      errorMonitor_->notifyFailure("[RecoveryCoordinator] alarm " + std::to_string(alarm.id) +
                                   " not recovered: " + e.what());
    }
  }
  return registered;
}
