/* @file SqliteAlarmStore.cpp
 * @brief alarm table CRUD over the sqlite3 C API
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>

// third-party headers
#include <sqlite3.h>

// Chime headers
#include "core/TimeUtil.hpp"
#include "io/SqliteAlarmStore.hpp"

using namespace chime::io;
using chime::core::Alarm;
using chime::core::AlarmId;
using chime::core::Instant;

namespace {
  constexpr const char* kSchema = "CREATE TABLE IF NOT EXISTS alarms ("
                                  "  id             INTEGER PRIMARY KEY AUTOINCREMENT,"
                                  "  title          TEXT    NOT NULL,"
                                  "  scheduled_time INTEGER NOT NULL,"
                                  "  is_active      INTEGER NOT NULL DEFAULT 1,"
                                  "  created_at     INTEGER NOT NULL,"
                                  "  fired_at       INTEGER"
                                  ");";

  constexpr const char* kSelectColumns =
      "SELECT id, title, scheduled_time, is_active, created_at, fired_at FROM alarms";

  // column indices for kSelectColumns
  enum Column { kId = 0, kTitle, kScheduled, kActive, kCreated, kFired };
} // namespace

void SqliteAlarmStore::StatementDeleter::operator()(sqlite3_stmt* stmt) const {
  sqlite3_finalize(stmt);
}

SqliteAlarmStore::SqliteAlarmStore(const std::string& dbPath) : path_(dbPath) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("[SqliteAlarmStore] open " + path_ + " failed: " + msg);
  }

  sqlite3_busy_timeout(db_, 2000);
  try {
    initSchema();
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteAlarmStore::~SqliteAlarmStore() {
  if (db_ && sqlite3_close(db_) != SQLITE_OK)
    std::cerr << "[SqliteAlarmStore] close: " << sqlite3_errmsg(db_) << "\n";
  db_ = nullptr;
}

AlarmId SqliteAlarmStore::insert(const std::string& title, Instant scheduledTime,
                                 Instant createdAt) {
  std::lock_guard lock(mtx_);
  auto stmt = prepare("INSERT INTO alarms (title, scheduled_time, is_active, created_at) "
                      "VALUES (?1, ?2, 1, ?3);");
  sqlite3_bind_text(stmt.get(), 1, title.c_str(), static_cast<int>(title.size()), SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 2, core::toEpochMillis(scheduledTime));
  sqlite3_bind_int64(stmt.get(), 3, core::toEpochMillis(createdAt));

  if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    fail("insert");
  return static_cast<AlarmId>(sqlite3_last_insert_rowid(db_));
}

std::vector<Alarm> SqliteAlarmStore::list() {
  std::lock_guard lock(mtx_);
  auto stmt = prepare((std::string(kSelectColumns) + " ORDER BY id;").c_str());

  std::vector<Alarm> out;
  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
    out.push_back(rowToAlarm(stmt.get()));
  if (rc != SQLITE_DONE)
    fail("list");
  return out;
}

std::optional<Alarm> SqliteAlarmStore::find(AlarmId id) {
  std::lock_guard lock(mtx_);
  auto stmt = prepare((std::string(kSelectColumns) + " WHERE id = ?1;").c_str());
  sqlite3_bind_int64(stmt.get(), 1, id);

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW)
    return rowToAlarm(stmt.get());
  if (rc != SQLITE_DONE)
    fail("find");
  return std::nullopt;
}

bool SqliteAlarmStore::remove(AlarmId id) {
  std::lock_guard lock(mtx_);
  auto stmt = prepare("DELETE FROM alarms WHERE id = ?1;");
  sqlite3_bind_int64(stmt.get(), 1, id);
  return stepChanges(stmt.get(), "remove");
}

bool SqliteAlarmStore::updateActive(AlarmId id, bool active) {
  std::lock_guard lock(mtx_);
  auto stmt = prepare("UPDATE alarms SET is_active = ?2 WHERE id = ?1;");
  sqlite3_bind_int64(stmt.get(), 1, id);
  sqlite3_bind_int(stmt.get(), 2, active ? 1 : 0);
  return stepChanges(stmt.get(), "updateActive");
}

bool SqliteAlarmStore::updateFired(AlarmId id, Instant firedAt) {
  std::lock_guard lock(mtx_);
  auto stmt = prepare("UPDATE alarms SET fired_at = ?2 WHERE id = ?1 AND fired_at IS NULL;");
  sqlite3_bind_int64(stmt.get(), 1, id);
  sqlite3_bind_int64(stmt.get(), 2, core::toEpochMillis(firedAt));
  return stepChanges(stmt.get(), "updateFired");
}

void SqliteAlarmStore::initSchema() { exec(kSchema); }

void SqliteAlarmStore::exec(const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw std::runtime_error("[SqliteAlarmStore] exec failed: " + msg);
  }
}

SqliteAlarmStore::Statement SqliteAlarmStore::prepare(const char* sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK)
    fail("prepare");
  return Statement(raw);
}

bool SqliteAlarmStore::stepChanges(sqlite3_stmt* stmt, const char* what) {
  if (sqlite3_step(stmt) != SQLITE_DONE)
    fail(what);
  return sqlite3_changes(db_) > 0;
}

Alarm SqliteAlarmStore::rowToAlarm(sqlite3_stmt* stmt) const {
  Alarm a;
  a.id = sqlite3_column_int64(stmt, kId);

  const unsigned char* title = sqlite3_column_text(stmt, kTitle);
  a.title = title ? reinterpret_cast<const char*>(title) : "";

  a.scheduledTime = core::fromEpochMillis(sqlite3_column_int64(stmt, kScheduled));

  const auto active = sqlite3_column_int64(stmt, kActive);
  if (active != 0 && active != 1)
    throw std::runtime_error("[SqliteAlarmStore] corrupt row " + std::to_string(a.id) +
                             ": is_active = " + std::to_string(active));
  a.isActive = active == 1;

  a.createdAt = core::fromEpochMillis(sqlite3_column_int64(stmt, kCreated));
  if (sqlite3_column_type(stmt, kFired) != SQLITE_NULL)
    a.firedAt = core::fromEpochMillis(sqlite3_column_int64(stmt, kFired));
  return a;
}

void SqliteAlarmStore::fail(const std::string& what) const {
  std::string msg = "[SqliteAlarmStore] " + what + " failed: " + sqlite3_errmsg(db_);
  std::cerr << msg << "\n";
  throw std::runtime_error(msg);
}
