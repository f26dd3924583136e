#pragma once
/** @file  SqliteAlarmStore.hpp
 *  @brief AlarmStore backed by a single SQLite table.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <mutex>
#include <string>

// Chime headers
#include "io/AlarmStore.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace chime {
  namespace io {

    /**
 * @class SqliteAlarmStore
 * @brief RAII owner of one `sqlite3*` connection.
 *
 *  * Creates the `alarms` table on open if it is missing.
 *  * One connection, serialised by a mutex (scheduler workers write fired_at).
 *  * *Non-copyable*; pass ":memory:" for a throw-away database.
 */
    class SqliteAlarmStore : public AlarmStore {
    public:
      /// Opens or creates \p dbPath; throws `std::runtime_error` on failure.
      explicit SqliteAlarmStore(const std::string& dbPath);
      ~SqliteAlarmStore() override;

      core::AlarmId insert(const std::string& title, core::Instant scheduledTime,
                           core::Instant createdAt) override;
      std::vector<core::Alarm> list() override;
      std::optional<core::Alarm> find(core::AlarmId id) override;
      bool remove(core::AlarmId id) override;
      bool updateActive(core::AlarmId id, bool active) override;
      bool updateFired(core::AlarmId id, core::Instant firedAt) override;

      SqliteAlarmStore(const SqliteAlarmStore&) = delete;
      SqliteAlarmStore& operator=(const SqliteAlarmStore&) = delete;

    private:
      struct StatementDeleter {
        void operator()(sqlite3_stmt* stmt) const;
      };
      using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

      void initSchema();
      void exec(const char* sql);
      Statement prepare(const char* sql);
      /// Runs a single-row UPDATE/DELETE; returns true if a row changed.
      bool stepChanges(sqlite3_stmt* stmt, const char* what);
      core::Alarm rowToAlarm(sqlite3_stmt* stmt) const;
      [[noreturn]] void fail(const std::string& what) const;

      std::string path_;
      sqlite3* db_{ nullptr };
      std::mutex mtx_;
    };

  } // namespace io
} // namespace chime
