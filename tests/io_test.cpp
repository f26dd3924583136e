// Chime-Prod headers
#include "core/TimeUtil.hpp"
#include "io/ConsoleNotifier.hpp"
#include "io/DesktopNotifier.hpp"
#include "io/FileLogger.hpp"
#include "io/LineReader.hpp"
#include "io/SqliteAlarmStore.hpp"

// GTest headers
#include <gtest/gtest.h>

// third-party headers
#include <sqlite3.h>

// STL headers
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>

// Linux headers
#include <pty.h> // openpty
#include <sys/stat.h>
#include <unistd.h>

namespace chime::test {

  using chime::core::fromEpochMillis;
  using chime::core::toEpochMillis;
  using chime::io::LineReader;
  using chime::io::SqliteAlarmStore;
  using namespace std::chrono_literals;

  namespace {
    std::string tempPath(const char* stem) {
      std::string path = std::string("/tmp/") + stem + "-XXXXXX";
      int fd = mkstemp(path.data());
      if (fd != -1)
        close(fd);
      std::remove(path.c_str()); // SQLite / fopen create it themselves
      return path;
    }

    std::string slurp(const std::string& path) {
      std::ifstream in(path);
      std::stringstream text;
      text << in.rdbuf();
      return text.str();
    }

    /// Executable shell script standing in for notify-send.
    std::string writeStub(const std::string& body) {
      const std::string path = tempPath("chime-notify");
      std::ofstream(path) << "#!/bin/sh\n" << body << "\n";
      chmod(path.c_str(), 0755);
      return path;
    }
  } // namespace

  // ------------------------------------------------------------- LineReader

  TEST(line_reader, reads_lines_from_a_pty) {
    // the console may be a terminal; exercise the same path the daemon does
    int masterFd, slaveFd;
    char slaveName[64];
    ASSERT_EQ(0, openpty(&masterFd, &slaveFd, slaveName, nullptr, nullptr));

    LineReader reader(slaveFd);
    const char* msg = "list\n";
    ASSERT_EQ(write(masterFd, msg, strlen(msg)), static_cast<ssize_t>(strlen(msg)));

    auto line = reader.readLine(500ms);
    ASSERT_TRUE(line);
    EXPECT_EQ(*line, "list");

    close(masterFd);
    close(slaveFd);
  }

  TEST(line_reader, frames_pipe_input_and_returns_tail_at_eof) {
    int fds[2];
    ASSERT_EQ(0, pipe(fds));

    const char* msg = "add +5 tea\r\nlist\npartial";
    ASSERT_EQ(write(fds[1], msg, strlen(msg)), static_cast<ssize_t>(strlen(msg)));
    close(fds[1]);

    LineReader reader(fds[0]);
    EXPECT_EQ(reader.readLine(100ms), "add +5 tea");
    EXPECT_EQ(reader.readLine(100ms), "list");
    EXPECT_EQ(reader.readLine(100ms), "partial");
    EXPECT_FALSE(reader.readLine(100ms));
    EXPECT_TRUE(reader.eof());
    close(fds[0]);
  }

  TEST(line_reader, times_out_without_input) {
    int fds[2];
    ASSERT_EQ(0, pipe(fds));

    LineReader reader(fds[0]);
    EXPECT_FALSE(reader.readLine(20ms));
    EXPECT_FALSE(reader.eof());
    close(fds[0]);
    close(fds[1]);
  }

  // ------------------------------------------------------- SqliteAlarmStore

  TEST(sqlite_store, insert_list_and_update_in_memory) {
    SqliteAlarmStore store(":memory:");

    auto a = store.insert("Wake up", fromEpochMillis(2000), fromEpochMillis(1000));
    auto b = store.insert("Stretch", fromEpochMillis(3000), fromEpochMillis(1000));
    EXPECT_LT(a, b);

    auto rows = store.list();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].id, a);
    EXPECT_EQ(rows[0].title, "Wake up");
    EXPECT_EQ(toEpochMillis(rows[0].scheduledTime), 2000);
    EXPECT_EQ(toEpochMillis(rows[0].createdAt), 1000);
    EXPECT_TRUE(rows[0].isActive);
    EXPECT_FALSE(rows[0].firedAt);

    EXPECT_TRUE(store.updateActive(a, false));
    EXPECT_TRUE(store.updateFired(b, fromEpochMillis(3001)));

    auto first = store.find(a);
    ASSERT_TRUE(first);
    EXPECT_FALSE(first->isActive);

    auto second = store.find(b);
    ASSERT_TRUE(second);
    ASSERT_TRUE(second->firedAt);
    EXPECT_EQ(toEpochMillis(*second->firedAt), 3001);
  }

  TEST(sqlite_store, missing_rows_report_false) {
    SqliteAlarmStore store(":memory:");
    EXPECT_FALSE(store.find(99));
    EXPECT_FALSE(store.remove(99));
    EXPECT_FALSE(store.updateActive(99, true));
    EXPECT_FALSE(store.updateFired(99, fromEpochMillis(1)));

    auto id = store.insert("x", fromEpochMillis(1), fromEpochMillis(0));
    EXPECT_TRUE(store.remove(id));
    EXPECT_TRUE(store.list().empty());
  }

  TEST(sqlite_store, fired_at_is_stamped_once) {
    SqliteAlarmStore store(":memory:");
    auto id = store.insert("Once", fromEpochMillis(2000), fromEpochMillis(1000));

    EXPECT_TRUE(store.updateFired(id, fromEpochMillis(2001)));
    EXPECT_FALSE(store.updateFired(id, fromEpochMillis(2500)));

    auto row = store.find(id);
    ASSERT_TRUE(row && row->firedAt);
    EXPECT_EQ(toEpochMillis(*row->firedAt), 2001);
  }

  TEST(sqlite_store, rows_survive_reopen) {
    const std::string path = tempPath("chime-db");
    {
      SqliteAlarmStore store(path);
      store.insert("Persisted", fromEpochMillis(5000), fromEpochMillis(10));
    }
    {
      SqliteAlarmStore store(path);
      auto rows = store.list();
      ASSERT_EQ(rows.size(), 1u);
      EXPECT_EQ(rows[0].title, "Persisted");
      EXPECT_EQ(toEpochMillis(rows[0].scheduledTime), 5000);
    }
    std::remove(path.c_str());
  }

  TEST(sqlite_store, corrupt_active_flag_throws) {
    const std::string path = tempPath("chime-db");
    {
      SqliteAlarmStore store(path); // creates the schema
    }
    sqlite3* db = nullptr;
    ASSERT_EQ(SQLITE_OK, sqlite3_open(path.c_str(), &db));
    ASSERT_EQ(SQLITE_OK,
              sqlite3_exec(db,
                           "INSERT INTO alarms (title, scheduled_time, is_active, created_at) "
                           "VALUES ('bad', 1, 7, 0);",
                           nullptr, nullptr, nullptr));
    sqlite3_close(db);

    SqliteAlarmStore store(path);
    EXPECT_THROW(store.list(), std::runtime_error);
    std::remove(path.c_str());
  }

  TEST(sqlite_store, unopenable_path_throws) {
    EXPECT_THROW({ SqliteAlarmStore store("/nonexistent-dir/chime.db"); }, std::runtime_error);
  }

  // ---------------------------------------------------------------- Notifiers

  TEST(console_notifier, prints_title_and_body) {
    std::ostringstream out;
    chime::io::ConsoleNotifier notifier(out);
    EXPECT_TRUE(notifier.isGranted());
    notifier.display("Wake up", "Alarm");
    EXPECT_EQ(out.str(), "\a[ALARM] Wake up: Alarm\n");
  }

  TEST(console_notifier, bad_stream_throws) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    chime::io::ConsoleNotifier notifier(out);
    EXPECT_THROW(notifier.display("t", "b"), std::runtime_error);
  }

  TEST(desktop_notifier, missing_program_is_not_granted) {
    chime::io::DesktopNotifier notifier("chime-no-such-notifier-binary");
    EXPECT_FALSE(notifier.isGranted());
    EXPECT_FALSE(notifier.request());
  }

  TEST(desktop_notifier, title_is_never_parsed_as_an_option) {
    const std::string out = tempPath("chime-argv");
    const std::string stub = writeStub("printf '%s\\n' \"$@\" > " + out);

    chime::io::DesktopNotifier notifier(stub);
    notifier.display("--help", "Alarm");
    EXPECT_EQ(slurp(out), "--app-name=chime\n--\n--help\nAlarm\n");

    std::remove(out.c_str());
    std::remove(stub.c_str());
  }

  TEST(desktop_notifier, nonzero_exit_throws) {
    const std::string stub = writeStub("exit 3");
    chime::io::DesktopNotifier notifier(stub);
    EXPECT_THROW(notifier.display("Wake up", "Alarm"), std::runtime_error);
    std::remove(stub.c_str());
  }

  // --------------------------------------------------------------- FileLogger

  TEST(file_logger, buffers_until_flush) {
    const std::string path = tempPath("chime-csv");
    chime::io::FileLogger file;
    ASSERT_TRUE(file.open(path));
    file.write("1,1,registered,\"\"\n");
    EXPECT_TRUE(file.flush());
    file.close();
    EXPECT_FALSE(file.isOpen());
    EXPECT_EQ(file.path(), path);

    std::ifstream in(path);
    std::stringstream text;
    text << in.rdbuf();
    EXPECT_EQ(text.str(), "1,1,registered,\"\"\n");
    std::remove(path.c_str());
  }

} // namespace chime::test
