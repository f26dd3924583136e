/* @file AlarmScheduler.cpp
 * @brief per-alarm wait threads, fire sequence and delivery backoff
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <iterator>
#include <stdexcept>

// Chime headers
#include "core/AlarmScheduler.hpp"
#include "core/Clock.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/NotifierGateway.hpp"
#include "core/TimeUtil.hpp"

using namespace chime::core;

namespace {
  std::string activationSuffix(std::uint64_t generation) {
    return " (activation " + std::to_string(generation) + ")";
  }
} // namespace

AlarmScheduler::AlarmScheduler(Clock& clock, std::shared_ptr<NotifierGateway> gateway,
                               std::shared_ptr<ErrorMonitor> errorMonitor,
                               std::shared_ptr<Logger> logger, SchedulerOptions options)
    : clock_(clock), gateway_(std::move(gateway)), errorMonitor_(std::move(errorMonitor)),
      logger_(std::move(logger)), options_(std::move(options)) {
  if (!gateway_)
    throw std::invalid_argument("[AlarmScheduler] notifier gateway is nullptr");
  if (!errorMonitor_)
    throw std::invalid_argument("[AlarmScheduler] error monitor is nullptr");
}

AlarmScheduler::~AlarmScheduler() { cancelAll(); }

void AlarmScheduler::setFireHandler(FireHandler handler) {
  std::lock_guard lock(mtx_);
  onFired_ = std::move(handler);
}

void AlarmScheduler::registerAlarm(AlarmId id, const std::string& title, Instant fireAt) {
  const bool overdue = fireAt <= clock_.now();
  if (overdue && options_.overdue == OverduePolicy::Reject)
    throw InvalidSchedule("alarm " + std::to_string(id) + " target " + formatUtc(fireAt) +
                          " is not in the future");

  std::vector<Worker> finished; // joined after the lock is released
  bool replaced = false;
  std::uint64_t generation = 0;
  {
    std::lock_guard lock(mtx_);
    finished = takeFinishedLocked();

    if (auto it = waits_.find(id); it != waits_.end()) {
      // a Delivering worker is left running; it simply no longer owns the slot
      const AlarmState prior = it->second.state;
      retireLocked(it->second, prior == AlarmState::Pending || prior == AlarmState::Due);
      waits_.erase(it);
      replaced = true;
    }

    generation = nextGeneration_++;
    Wait& wait = waits_[id];
    wait.generation = generation;
    wait.title = title;
    wait.fireAt = fireAt;
    wait.state = AlarmState::Pending;
    wait.worker.done = std::make_shared<std::atomic<bool>>(false);

    auto done = wait.worker.done;
    wait.worker.thread = std::jthread([this, id, generation, title, fireAt, done](std::stop_token stop) {
      try {
        run(id, generation, title, fireAt, stop);
      } catch (const std::exception& e) {
        errorMonitor_->notifyFailure("[AlarmScheduler] alarm " + std::to_string(id) +
                                     " worker aborted: " + e.what() + activationSuffix(generation));
      }
      done->store(true);
    });
  }

  note(id, replaced ? "replaced" : "registered",
       formatUtc(fireAt) + (overdue ? " overdue" : "") + activationSuffix(generation));
}

void AlarmScheduler::cancel(AlarmId id) {
  std::vector<Worker> finished;
  const char* event = nullptr;
  {
    std::lock_guard lock(mtx_);
    finished = takeFinishedLocked();

    auto it = waits_.find(id);
    if (it == waits_.end())
      return;

    switch (it->second.state) {
    case AlarmState::Pending:
    case AlarmState::Due:
      retireLocked(it->second, true);
      waits_.erase(it);
      event = "cancelled";
      break;
    case AlarmState::Delivering:
      event = "cancel_ignored_delivering";
      break;
    default: // DeliveryFailed: forget the status, the worker is already retired
      retireLocked(it->second, false);
      waits_.erase(it);
      event = "cleared";
      break;
    }
  }
  note(id, event);
}

void AlarmScheduler::cancelAll() {
  std::vector<Worker> all;
  {
    std::lock_guard lock(mtx_);
    for (auto& [id, wait] : waits_)
      retireLocked(wait, true);
    waits_.clear();

    all = std::move(retired_);
    retired_.clear();
  }

  for (auto& w : all)
    w.thread.request_stop();
  all.clear(); // jthread dtor joins
}

std::vector<AlarmId> AlarmScheduler::pendingIds() const {
  std::vector<AlarmId> ids;
  {
    std::lock_guard lock(mtx_);
    for (const auto& [id, wait] : waits_) {
      if (wait.state == AlarmState::Pending || wait.state == AlarmState::Due ||
          wait.state == AlarmState::Delivering)
        ids.push_back(id);
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::optional<AlarmState> AlarmScheduler::stateOf(AlarmId id) const {
  std::lock_guard lock(mtx_);
  auto it = waits_.find(id);
  if (it == waits_.end())
    return std::nullopt;
  return it->second.state;
}

bool AlarmScheduler::isPending(AlarmId id) const {
  auto state = stateOf(id);
  return state && *state != AlarmState::DeliveryFailed;
}

// -------------------------------------------------------------------
// worker side
// -------------------------------------------------------------------

void AlarmScheduler::run(AlarmId id, std::uint64_t generation, const std::string& title,
                         Instant fireAt, std::stop_token stop) {
  if (!clock_.sleepUntil(fireAt, stop))
    return; // cancelled, replaced or shutting down

  if (!advance(id, generation, AlarmState::Pending, AlarmState::Due, stop))
    return;
  note(id, "due", activationSuffix(generation));

  if (!advance(id, generation, AlarmState::Due, AlarmState::Delivering, stop))
    return;
  note(id, "delivering", title);

  // from here on cancel() is not honoured
  std::string lastError;
  switch (deliverWithRetry(id, title, stop, lastError)) {
  case Outcome::Delivered:
    markFiredWithRetry(id, generation, stop);
    finish(id, generation, AlarmState::Fired);
    break;

  case Outcome::Exhausted:
    finish(id, generation, AlarmState::DeliveryFailed);
    note(id, "delivery_failed", lastError);
    errorMonitor_->notifyFailure(DeliveryFailed(id, lastError).what() +
                                 activationSuffix(generation));
    break;

  case Outcome::Abandoned:
    // shutdown mid-backoff: row is still active and unfired, next boot retries it
    finish(id, generation, AlarmState::Cancelled);
    note(id, "delivery_abandoned", lastError);
    break;
  }
}

AlarmScheduler::Outcome AlarmScheduler::deliverWithRetry(AlarmId id, const std::string& title,
                                                         std::stop_token stop,
                                                         std::string& lastError) {
  const RetryPolicy& retry = options_.retry;
  const unsigned attempts = std::max(1u, retry.maxAttempts);

  for (unsigned attempt = 1; attempt <= attempts; ++attempt) {
    try {
      gateway_->deliver(title, options_.notificationBody);
      return Outcome::Delivered;
    } catch (const DeliveryError& e) {
      lastError = e.what();
      note(id, "delivery_attempt_failed",
           "attempt " + std::to_string(attempt) + "/" + std::to_string(attempts) + ": " + lastError);
    }

    if (attempt == attempts)
      break;
    if (!clock_.sleepUntil(clock_.now() + retry.delayAfter(attempt), stop))
      return Outcome::Abandoned;
  }
  return Outcome::Exhausted;
}

void AlarmScheduler::markFiredWithRetry(AlarmId id, std::uint64_t generation,
                                        std::stop_token stop) {
  FireHandler handler;
  {
    std::lock_guard lock(mtx_);
    handler = onFired_;
  }
  if (!handler) {
    note(id, "fired", "no fire handler installed");
    return;
  }

  const RetryPolicy& retry = options_.retry;
  const unsigned attempts = std::max(1u, retry.maxAttempts);
  std::string lastError;

  for (unsigned attempt = 1; attempt <= attempts; ++attempt) {
    try {
      handler(id);
      note(id, "fired", activationSuffix(generation));
      return;
    } catch (const NotFound&) {
      // deleted between due-time and delivery: nothing left to mark
      note(id, "mark_fired_not_found");
      return;
    } catch (const std::exception& e) {
      lastError = e.what();
      note(id, "mark_fired_failed", "attempt " + std::to_string(attempt) + ": " + lastError);
    }

    if (attempt == attempts)
      break;
    if (!clock_.sleepUntil(clock_.now() + retry.delayAfter(attempt), stop))
      break;
  }

  errorMonitor_->notifyFailure("alarm " + std::to_string(id) +
                               " delivered but not marked fired: " + lastError +
                               activationSuffix(generation));
}

bool AlarmScheduler::advance(AlarmId id, std::uint64_t generation, AlarmState from, AlarmState to,
                             const std::stop_token& stop) {
  std::lock_guard lock(mtx_);
  if (stop.stop_requested())
    return false;

  auto it = waits_.find(id);
  if (it == waits_.end() || it->second.generation != generation || it->second.state != from)
    return false;

  it->second.state = to;
  return true;
}

void AlarmScheduler::finish(AlarmId id, std::uint64_t generation, AlarmState terminal) {
  std::lock_guard lock(mtx_);
  auto it = waits_.find(id);
  if (it == waits_.end() || it->second.generation != generation)
    return; // replaced or torn down while delivering; our handle is already retired

  retireLocked(it->second, false);
  if (terminal == AlarmState::DeliveryFailed)
    it->second.state = AlarmState::DeliveryFailed;
  else
    waits_.erase(it);
}

std::vector<AlarmScheduler::Worker> AlarmScheduler::takeFinishedLocked() {
  std::vector<Worker> finished;
  auto keep = std::partition(retired_.begin(), retired_.end(),
                             [](const Worker& w) { return !w.done || !w.done->load(); });
  std::move(keep, retired_.end(), std::back_inserter(finished));
  retired_.erase(keep, retired_.end());
  return finished;
}

void AlarmScheduler::retireLocked(Wait& wait, bool stop) {
  if (stop)
    wait.worker.thread.request_stop();
  if (wait.worker.thread.joinable())
    retired_.push_back(std::move(wait.worker));
}

void AlarmScheduler::note(AlarmId id, const char* event, const std::string& detail) const {
  if (logger_)
    logger_->log(LogEvent{ clock_.now(), id, event, detail });
}
