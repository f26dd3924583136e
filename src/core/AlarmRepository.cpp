/* @file AlarmRepository.cpp
 * @brief store façade + lifecycle mutators
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <stdexcept>

// Chime headers
#include "core/AlarmRepository.hpp"
#include "core/Clock.hpp"
#include "core/Errors.hpp"
#include "io/AlarmStore.hpp"

using namespace chime::core;

AlarmRepository::AlarmRepository(std::shared_ptr<io::AlarmStore> store, Clock& clock)
    : store_(std::move(store)), clock_(clock) {
  if (!store_)
    throw std::invalid_argument("[AlarmRepository] store is nullptr");
}

Alarm AlarmRepository::create(const std::string& title, Instant scheduledTime) {
  const bool blank = std::all_of(title.begin(), title.end(),
                                 [](unsigned char c) { return std::isspace(c) != 0; });
  if (blank)
    throw InvalidSchedule("alarm title must not be empty");

  Alarm alarm;
  alarm.title = title;
  alarm.scheduledTime = scheduledTime;
  alarm.createdAt = clock_.now();
  alarm.isActive = true;
  alarm.id = store_->insert(alarm.title, alarm.scheduledTime, alarm.createdAt);
  return alarm;
}

std::vector<Alarm> AlarmRepository::list() const { return store_->list(); }

std::vector<Alarm> AlarmRepository::listRecoverable() const {
  std::vector<Alarm> rows = store_->list();
  rows.erase(std::remove_if(rows.begin(), rows.end(),
                            [](const Alarm& a) { return !a.isActive || a.firedAt.has_value(); }),
             rows.end());
  return rows;
}

Alarm AlarmRepository::get(AlarmId id) const {
  auto alarm = store_->find(id);
  if (!alarm)
    throw NotFound(id);
  return *alarm;
}

std::optional<Alarm> AlarmRepository::find(AlarmId id) const { return store_->find(id); }

void AlarmRepository::remove(AlarmId id) {
  if (!store_->remove(id))
    throw NotFound(id);
}

Instant AlarmRepository::markFired(AlarmId id) {
  const Instant now = clock_.now();
  if (!store_->updateFired(id, now))
    throw NotFound(id);
  return now;
}

void AlarmRepository::setActive(AlarmId id, bool active) {
  if (!store_->updateActive(id, active))
    throw NotFound(id);
}
