#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV event log (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/Alarm.hpp"

namespace chime {
  namespace io {
    class FileLogger;
  } // namespace io

  namespace core {

    /// One CSV row: `timestamp_ms,alarm_id,event,detail`.
    struct LogEvent {
      Instant at{};
      AlarmId alarmId{ 0 };
      std::string event;
      std::string detail{};
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief Alarm lifecycle journal.  `log()` only enqueues; the worker owns the file.
 *
 *  * Events logged before `start()` or after `stop()` are discarded.
 *  * On overflow the oldest queued event is dropped (see `dropped()`).
 */
    class Logger {

    public:
      static constexpr std::size_t kDefaultCapacity = 1024;

      explicit Logger(std::size_t capacity = kDefaultCapacity);
      virtual ~Logger(); ///< stop()

      // --- public API ---
      bool start(const std::string& path); ///< open file + launch worker thread
      virtual void log(const LogEvent& event); ///< enqueue event (non-blocking)
      void stop();                         ///< drain + join worker thread

      bool running() const { return running_.load(); }
      std::size_t dropped() const;

      /// Renders \p event as a CSV line (with trailing newline); detail is quoted.
      static std::string toCsv(const LogEvent& event);

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void drain();

      std::unique_ptr<io::FileLogger> file_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::size_t capacity_;
      std::thread worker_;
      std::mutex lifecycleMtx_;
      std::atomic<bool> running_{ false };
    };

  } // namespace core
} // namespace chime
