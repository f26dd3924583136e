#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace chime {
  namespace core {

    /**
 * @class ErrorMonitor
 * @brief Scheduler workers call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique error.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so the host doesn’t get spammed.
 * * Remembers at most `historyLimit` messages; the oldest is forgotten first.
 * * The callback runs outside the lock, on the reporting thread.
 */
    class ErrorMonitor {
    public:
      static constexpr std::size_t kDefaultHistoryLimit = 256;

      explicit ErrorMonitor(std::size_t historyLimit = kDefaultHistoryLimit);
      virtual ~ErrorMonitor() = default;

      /// Register a lambda that surfaces a fault to the operator.
      void registerEscalation(std::function<void(const std::string&)> cb);

      /// Called by subsystems on fault; will forward to the escalation callback.
      virtual void notifyFailure(const std::string& message);

      /// Remembered unique messages, oldest first.
      std::vector<std::string> failures() const;

    private:
      bool rememberIfNew(const std::string& message);

      std::function<void(const std::string&)> escalation_{};
      std::deque<std::string> seen_; ///< de-dupe window
      std::size_t historyLimit_;
      mutable std::mutex mtx_;
    };

  } // namespace core
} // namespace chime
