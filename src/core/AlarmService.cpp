/* @file AlarmService.cpp
 * @brief API handlers keeping the alarm table and the scheduler map in step
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// Chime headers
#include "core/AlarmRepository.hpp"
#include "core/AlarmScheduler.hpp"
#include "core/AlarmService.hpp"
#include "core/Clock.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/NotifierGateway.hpp"
#include "core/RecoveryCoordinator.hpp"
#include "core/TimeUtil.hpp"

using namespace chime::core;

AlarmService::AlarmService(AlarmRepository& repository, AlarmScheduler& scheduler,
                           RecoveryCoordinator& recovery, std::shared_ptr<NotifierGateway> gateway,
                           Clock& clock, std::shared_ptr<Logger> logger)
    : repository_(repository), scheduler_(scheduler), recovery_(recovery),
      gateway_(std::move(gateway)), clock_(clock), logger_(std::move(logger)) {
  if (!gateway_)
    throw std::invalid_argument("[AlarmService] notifier gateway is nullptr");

  scheduler_.setFireHandler([&repo = repository_](AlarmId id) { repo.markFired(id); });
}

std::size_t AlarmService::start() {
  std::lock_guard lock(startMtx_);
  if (started_)
    return 0;

  const std::size_t recovered = recovery_.recover();
  started_ = true;
  note(0, "started", std::to_string(recovered) + " alarm(s) recovered");
  return recovered;
}

AlarmId AlarmService::createAlarm(const std::string& title, Instant at) {
  requireStarted();
  requirePermission();

  // refuse before persisting so a rejected alarm never lands in the table
  if (scheduler_.options().overdue == OverduePolicy::Reject && at <= clock_.now())
    throw InvalidSchedule("alarm time " + formatUtc(at) + " is not in the future");

  const Alarm alarm = repository_.create(title, at);
  note(alarm.id, "created", alarm.title);

  try {
    scheduler_.registerAlarm(alarm.id, alarm.title, alarm.scheduledTime);
  } catch (const InvalidSchedule&) {
    repository_.remove(alarm.id); // became overdue between the check and register
    throw;
  }
  return alarm.id;
}

std::vector<AlarmView> AlarmService::listAlarms() const {
  std::vector<AlarmView> views;
  for (Alarm& alarm : repository_.list()) {
    AlarmView view;
    const auto live = scheduler_.stateOf(alarm.id);

    if (alarm.firedAt)
      view.status = AlarmState::Fired;
    else if (live == AlarmState::DeliveryFailed)
      view.status = AlarmState::DeliveryFailed;
    else if (!alarm.isActive)
      view.status = AlarmState::Cancelled;
    else
      view.status = live.value_or(AlarmState::Pending);

    view.alarm = std::move(alarm);
    views.push_back(std::move(view));
  }
  return views;
}

void AlarmService::deleteAlarm(AlarmId id) {
  requireStarted();
  scheduler_.cancel(id); // an in-flight delivery finishes and hits NotFound on mark
  repository_.remove(id);
  note(id, "deleted");
}

void AlarmService::toggleAlarm(AlarmId id, bool active) {
  requireStarted();
  const Alarm alarm = repository_.get(id);

  if (!active) {
    repository_.setActive(id, false);
    scheduler_.cancel(id);
    note(id, "toggled", "off");
    return;
  }

  requirePermission();
  repository_.setActive(id, true);
  note(id, "toggled", "on");
  if (alarm.firedAt)
    return; // history only; a fired alarm is never armed again
  if (scheduler_.isPending(id))
    return; // still armed or mid-delivery, even if toggled off meanwhile

  try {
    scheduler_.registerAlarm(alarm.id, alarm.title, alarm.scheduledTime);
  } catch (const InvalidSchedule&) {
    repository_.setActive(id, alarm.isActive);
    throw;
  }
}

void AlarmService::requireStarted() const {
  if (!started_)
    throw std::logic_error("[AlarmService] recovery has not run yet");
}

void AlarmService::requirePermission() {
  if (gateway_->isGranted() || gateway_->request())
    return;
  throw PermissionDenied("notification permission denied");
}

void AlarmService::note(AlarmId id, const char* event, const std::string& detail) const {
  if (logger_)
    logger_->log(LogEvent{ clock_.now(), id, event, detail });
}
