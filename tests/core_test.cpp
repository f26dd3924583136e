// Chime-Prod headers
#include "core/Alarm.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/NotifierFactory.hpp"
#include "core/NotifierGateway.hpp"
#include "core/RingBuffer.hpp"
#include "core/SchedulePolicy.hpp"
#include "core/TimeUtil.hpp"

// Chime-Fake headers
#include "ScriptedNotifier.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <cstdio>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace chime::test {

  using namespace chime::core;
  using namespace std::chrono_literals;
  using ::testing::HasSubstr;

  // ---------------------------------------------------------------- RetryPolicy

  TEST(retry_policy, backoff_grows_geometrically_and_caps) {
    RetryPolicy p;
    p.initialBackoff = 500ms;
    p.backoffMultiplier = 2.0;
    p.maxBackoff = 3000ms;

    EXPECT_EQ(p.delayAfter(0), 0ms);
    EXPECT_EQ(p.delayAfter(1), 500ms);
    EXPECT_EQ(p.delayAfter(2), 1000ms);
    EXPECT_EQ(p.delayAfter(3), 2000ms);
    EXPECT_EQ(p.delayAfter(4), 3000ms);
    EXPECT_EQ(p.delayAfter(40), 3000ms);
  }

  TEST(retry_policy, defaults_are_bounded) {
    RetryPolicy p;
    EXPECT_EQ(p.maxAttempts, 5u);
    EXPECT_EQ(p.initialBackoff, 500ms);
    EXPECT_EQ(p.maxBackoff, 10000ms);
  }

  // ------------------------------------------------------------------- TimeUtil

  TEST(time_util, epoch_millis_and_iso_strings) {
    const Instant t = fromEpochMillis(1'700'000'000'123);
    EXPECT_EQ(toEpochMillis(t), 1'700'000'000'123);
    EXPECT_EQ(formatUtc(t), "2023-11-14T22:13:20Z");

    auto parsed = parseUtc("2023-11-14T22:13:20Z");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(toEpochMillis(*parsed), 1'700'000'000'000);
  }

  TEST(time_util, parse_rejects_malformed_input) {
    EXPECT_FALSE(parseUtc(""));
    EXPECT_FALSE(parseUtc("2023-11-14 22:13:20"));
    EXPECT_FALSE(parseUtc("2023-13-01T00:00:00Z"));
    EXPECT_FALSE(parseUtc("2023-11-14T22:13:20Zjunk"));
  }

  TEST(alarm_state, names_are_stable) {
    EXPECT_STREQ(toString(AlarmState::Pending), "Pending");
    EXPECT_STREQ(toString(AlarmState::DeliveryFailed), "DeliveryFailed");
    EXPECT_STREQ(toString(OverduePolicy::FireImmediately), "fire_immediately");
    EXPECT_STREQ(toString(OverduePolicy::Reject), "reject");
  }

  TEST(errors, messages_carry_the_id) {
    NotFound nf(7);
    EXPECT_EQ(nf.id(), 7);
    EXPECT_THAT(nf.what(), HasSubstr("alarm 7 not found"));

    DeliveryFailed df(3, "bus down");
    EXPECT_STREQ(df.what(), "alarm 3 delivery failed: bus down");
  }

  // ----------------------------------------------------------------- RingBuffer

  TEST(ring_buffer, drops_oldest_when_full) {
    RingBuffer<int> rb(2);
    EXPECT_TRUE(rb.push(1));
    EXPECT_TRUE(rb.push(2));
    EXPECT_FALSE(rb.push(3));
    EXPECT_EQ(rb.dropped(), 1u);

    EXPECT_EQ(rb.popFor(0ms), 2);
    EXPECT_EQ(rb.popFor(0ms), 3);
    EXPECT_FALSE(rb.popFor(0ms));
  }

  TEST(ring_buffer, close_wakes_consumer) {
    RingBuffer<int> rb(4);
    rb.close();
    EXPECT_TRUE(rb.closed());
    EXPECT_FALSE(rb.popFor(std::chrono::hours{ 1 })); // returns at once
  }

  // ------------------------------------------------------------------- Logger

  TEST(logger, csv_quotes_detail) {
    LogEvent ev{ fromEpochMillis(42), 9, "delivery_failed", "said \"no\"" };
    EXPECT_EQ(Logger::toCsv(ev), "42,9,delivery_failed,\"said \"\"no\"\"\"\n");
  }

  TEST(logger, writes_queued_events_on_stop) {
    char path[] = "/tmp/chime-log-XXXXXX";
    int fd = mkstemp(path);
    ASSERT_NE(fd, -1);
    close(fd);

    Logger logger;
    logger.log({ fromEpochMillis(1), 1, "ignored" }); // not running yet
    ASSERT_TRUE(logger.start(path));
    logger.log({ fromEpochMillis(2), 1, "registered" });
    logger.log({ fromEpochMillis(3), 1, "fired", "ok" });
    logger.stop();
    EXPECT_FALSE(logger.running());

    std::ifstream in(path);
    std::stringstream text;
    text << in.rdbuf();
    EXPECT_EQ(text.str(), "2,1,registered,\"\"\n3,1,fired,\"ok\"\n");
    std::remove(path);
  }

  TEST(logger, start_fails_on_unwritable_path) {
    Logger logger;
    EXPECT_FALSE(logger.start("/nonexistent-dir/chime.csv"));
    EXPECT_FALSE(logger.running());
  }

  // ------------------------------------------------------------- ErrorMonitor

  TEST(error_monitor, escalates_each_unique_message_once) {
    ErrorMonitor monitor;
    std::vector<std::string> escalated;
    monitor.registerEscalation([&](const std::string& m) { escalated.push_back(m); });

    monitor.notifyFailure("a");
    monitor.notifyFailure("a");
    monitor.notifyFailure("b");

    EXPECT_EQ(escalated, (std::vector<std::string>{ "a", "b" }));
    EXPECT_EQ(monitor.failures(), escalated);
  }

  TEST(error_monitor, history_is_bounded_and_forgets_oldest) {
    ErrorMonitor monitor(2);
    int escalations = 0;
    monitor.registerEscalation([&](const std::string&) { ++escalations; });

    monitor.notifyFailure("alarm 1 delivery failed (activation 1)");
    monitor.notifyFailure("alarm 1 delivery failed (activation 2)");
    monitor.notifyFailure("alarm 1 delivery failed (activation 3)");
    EXPECT_EQ(monitor.failures(), (std::vector<std::string>{ "alarm 1 delivery failed (activation 2)",
                                                             "alarm 1 delivery failed (activation 3)" }));

    monitor.notifyFailure("alarm 1 delivery failed (activation 3)"); // still remembered
    monitor.notifyFailure("alarm 1 delivery failed (activation 1)"); // aged out, reported again
    EXPECT_EQ(escalations, 4);
    EXPECT_EQ(monitor.failures().size(), 2u);
  }

  // ---------------------------------------------------------- NotifierGateway

  TEST(notifier_gateway, wraps_backend_errors_as_delivery_error) {
    auto notifier = std::make_shared<ScriptedNotifier>();
    NotifierGateway gateway(notifier);

    notifier->fail_next = 1;
    EXPECT_THROW(gateway.deliver("t", "b"), DeliveryError);
    EXPECT_NO_THROW(gateway.deliver("t", "b"));
    EXPECT_EQ(notifier->callCount(), 2u);
  }

  TEST(notifier_gateway, forwards_permission_calls) {
    auto notifier = std::make_shared<ScriptedNotifier>();
    notifier->granted = false;
    NotifierGateway gateway(notifier);

    EXPECT_FALSE(gateway.isGranted());
    EXPECT_FALSE(gateway.request());
    notifier->grant_on_request = true;
    EXPECT_TRUE(gateway.request());
    EXPECT_TRUE(gateway.isGranted());
  }

  TEST(notifier_gateway, rejects_null_notifier) {
    EXPECT_THROW({ NotifierGateway gateway(nullptr); }, std::invalid_argument);
  }

  // ---------------------------------------------------------- NotifierFactory

  TEST(notifier_factory, creates_registered_names_only) {
    NotifierFactory factory;
    EXPECT_TRUE(factory.registerNotifier("scripted", [] { return std::make_shared<ScriptedNotifier>(); }));
    EXPECT_FALSE(factory.registerNotifier("scripted", [] { return std::make_shared<ScriptedNotifier>(); }));

    EXPECT_NE(factory.create("scripted"), nullptr);
    EXPECT_THROW(factory.create("pager"), std::out_of_range);
    EXPECT_EQ(factory.names(), std::vector<std::string>{ "scripted" });
  }

  // ------------------------------------------------------------- ConfigLoader

  TEST(config_loader, empty_object_gives_defaults) {
    EngineConfig cfg = ConfigLoader::fromText("{}");
    EXPECT_EQ(cfg.databasePath, "chime.db");
    EXPECT_EQ(cfg.notifier, "console");
    EXPECT_EQ(cfg.notificationBody, "Alarm");
    EXPECT_EQ(cfg.overdue, OverduePolicy::FireImmediately);
    EXPECT_EQ(cfg.retry.maxAttempts, 5u);
  }

  TEST(config_loader, reads_every_key) {
    EngineConfig cfg = ConfigLoader::fromText(R"({
      "database_path": "/var/lib/chime/alarms.db",
      "event_log_path": "",
      "notifier": "desktop",
      "notification_body": "Time!",
      "overdue_policy": "reject",
      "retry": { "max_attempts": 3, "initial_backoff_ms": 100,
                 "backoff_multiplier": 1.5, "max_backoff_ms": 1000 }
    })");
    EXPECT_EQ(cfg.databasePath, "/var/lib/chime/alarms.db");
    EXPECT_TRUE(cfg.eventLogPath.empty());
    EXPECT_EQ(cfg.notifier, "desktop");
    EXPECT_EQ(cfg.notificationBody, "Time!");
    EXPECT_EQ(cfg.overdue, OverduePolicy::Reject);
    EXPECT_EQ(cfg.retry.maxAttempts, 3u);
    EXPECT_EQ(cfg.retry.initialBackoff, 100ms);
    EXPECT_DOUBLE_EQ(cfg.retry.backoffMultiplier, 1.5);
    EXPECT_EQ(cfg.retry.maxBackoff, 1000ms);
  }

  TEST(config_loader, rejects_bad_values_naming_the_key) {
    auto messageOf = [](const std::string& text) {
      try {
        ConfigLoader::fromText(text);
      } catch (const std::runtime_error& e) {
        return std::string(e.what());
      }
      return std::string("no error");
    };

    EXPECT_THAT(messageOf("not json"), HasSubstr("parse error"));
    EXPECT_THAT(messageOf("[]"), HasSubstr("object"));
    EXPECT_THAT(messageOf(R"({"overdue_policy": "later"})"), HasSubstr("overdue_policy"));
    EXPECT_THAT(messageOf(R"({"notifier": 5})"), HasSubstr("notifier"));
    EXPECT_THAT(messageOf(R"({"retry": {"max_attempts": 0}})"), HasSubstr("max_attempts"));
    EXPECT_THAT(messageOf(R"({"retry": {"initial_backoff_ms": 50, "max_backoff_ms": 10}})"),
                HasSubstr("max_backoff_ms"));
    EXPECT_THAT(messageOf(R"({"retry": {"backoff_multiplier": 0.5}})"),
                HasSubstr("backoff_multiplier"));
  }

  TEST(config_loader, missing_file_throws) {
    EXPECT_THROW(ConfigLoader("/nonexistent/chime.json").load(), std::runtime_error);
  }

} // namespace chime::test
