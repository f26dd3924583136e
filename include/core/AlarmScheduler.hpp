#pragma once
/** @file  AlarmScheduler.hpp
 *  @brief One cancellable wait per active alarm; fires, retries, reports.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

// Chime headers
#include "core/Alarm.hpp"
#include "core/SchedulePolicy.hpp"

namespace chime {
  namespace core {

    class Clock;
    class ErrorMonitor;
    class Logger;
    class NotifierGateway;

    struct SchedulerOptions {
      OverduePolicy overdue{ OverduePolicy::FireImmediately };
      RetryPolicy retry{};
      std::string notificationBody{ "Alarm" }; ///< body text of every toast
    };

    /**
 * @class AlarmScheduler
 * @brief Owns the id → wait map.  Each wait is a `std::jthread` sleeping on the
 *        shared Clock until its target instant.
 *
 *  * The mutex guards the map only, never a sleep or a notifier call.
 *  * Same-id operations are linearised; a per-registration generation keeps a
 *    replaced worker from touching the entry that replaced it.
 *  * `cancel` stops a wait that is Pending or Due.  Once Delivering, the fire
 *    runs to completion.
 *  * Fire sequence: deliver (with bounded backoff) → fire handler (marks the
 *    row fired; `NotFound` is absorbed) → entry removed.  Exhausted retries
 *    leave the entry in DeliveryFailed and are reported to the ErrorMonitor.
 *  * Neither `cancelAll()` nor the destructor may be called from a fire handler.
 */
    class AlarmScheduler {

    public:
      /// Called on the worker thread after a successful delivery. May throw NotFound.
      using FireHandler = std::function<void(AlarmId)>;

      AlarmScheduler(Clock& clock, std::shared_ptr<NotifierGateway> gateway,
                     std::shared_ptr<ErrorMonitor> errorMonitor, std::shared_ptr<Logger> logger,
                     SchedulerOptions options = {});
      ~AlarmScheduler(); ///< cancelAll()

      AlarmScheduler(const AlarmScheduler&) = delete;
      AlarmScheduler& operator=(const AlarmScheduler&) = delete;

      //---public API------------------------------------------------------
      void setFireHandler(FireHandler handler);

      /** Schedules (or re-schedules) the wake-up for \p id.
       *  @throws InvalidSchedule if \p fireAt is not in the future and the
       *          overdue policy is Reject. */
      void registerAlarm(AlarmId id, const std::string& title, Instant fireAt);

      /// Drops a pending wake-up.  No-op for unknown or delivering ids.
      void cancel(AlarmId id);

      /// Stops and joins every worker, clears the map.
      void cancelAll();

      //---introspection---------------------------------------------------
      std::vector<AlarmId> pendingIds() const; ///< Pending, Due or Delivering, sorted
      std::optional<AlarmState> stateOf(AlarmId id) const;
      bool isPending(AlarmId id) const;

      const SchedulerOptions& options() const { return options_; }

    private:
      enum class Outcome { Delivered, Exhausted, Abandoned };

      struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done; ///< set as the thread's last action
      };

      struct Wait {
        std::uint64_t generation{ 0 };
        std::string title;
        Instant fireAt{};
        AlarmState state{ AlarmState::Pending };
        Worker worker;
      };

      void run(AlarmId id, std::uint64_t generation, const std::string& title, Instant fireAt,
               std::stop_token stop);
      Outcome deliverWithRetry(AlarmId id, const std::string& title, std::stop_token stop,
                               std::string& lastError);
      void markFiredWithRetry(AlarmId id, std::uint64_t generation, std::stop_token stop);

      /// Moves the entry from \p from to \p to if it is still this generation and not stopped.
      bool advance(AlarmId id, std::uint64_t generation, AlarmState from, AlarmState to,
                   const std::stop_token& stop);
      void finish(AlarmId id, std::uint64_t generation, AlarmState terminal);

      /// Pulls finished workers out of `retired_`; caller destroys them outside the lock.
      std::vector<Worker> takeFinishedLocked();
      void retireLocked(Wait& wait, bool stop);

      void note(AlarmId id, const char* event, const std::string& detail = {}) const;

      Clock& clock_;
      std::shared_ptr<NotifierGateway> gateway_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> logger_;
      const SchedulerOptions options_;

      FireHandler onFired_{};
      std::unordered_map<AlarmId, Wait> waits_;
      std::vector<Worker> retired_; ///< replaced/cancelled/finished threads awaiting join
      std::uint64_t nextGeneration_{ 1 };
      mutable std::mutex mtx_;
    };

  } // namespace core
} // namespace chime
