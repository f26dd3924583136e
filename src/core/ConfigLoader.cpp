/* @file ConfigLoader.cpp
 * @brief JSON → EngineConfig with per-key validation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <sstream>
#include <stdexcept>

// third-party headers
#include <nlohmann/json.hpp>

// Chime headers
#include "core/ConfigLoader.hpp"

using namespace chime::core;
using nlohmann::json;

namespace {

  [[noreturn]] void badKey(const std::string& key, const std::string& why) {
    throw std::runtime_error("[ConfigLoader] '" + key + "' " + why);
  }

  /// Reads \p key into \p out if present; type mismatches name the key.
  template <typename T> void readOptional(const json& obj, const std::string& key, T& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
      return;
    try {
      out = it->get<T>();
    } catch (const json::exception& e) {
      badKey(key, std::string("has the wrong type: ") + e.what());
    }
  }

  OverduePolicy parseOverdue(const std::string& text) {
    if (text == toString(OverduePolicy::FireImmediately))
      return OverduePolicy::FireImmediately;
    if (text == toString(OverduePolicy::Reject))
      return OverduePolicy::Reject;
    badKey("overdue_policy", "must be \"fire_immediately\" or \"reject\", got \"" + text + "\"");
  }

  RetryPolicy parseRetry(const json& obj) {
    if (!obj.is_object())
      badKey("retry", "must be an object");

    RetryPolicy retry;
    std::int64_t attempts = retry.maxAttempts;
    std::int64_t initialMs = retry.initialBackoff.count();
    std::int64_t maxMs = retry.maxBackoff.count();
    double multiplier = retry.backoffMultiplier;

    readOptional(obj, "max_attempts", attempts);
    readOptional(obj, "initial_backoff_ms", initialMs);
    readOptional(obj, "max_backoff_ms", maxMs);
    readOptional(obj, "backoff_multiplier", multiplier);

    if (attempts < 1 || attempts > 100)
      badKey("retry.max_attempts", "must be between 1 and 100");
    if (initialMs < 0)
      badKey("retry.initial_backoff_ms", "must not be negative");
    if (maxMs < initialMs)
      badKey("retry.max_backoff_ms", "must be >= retry.initial_backoff_ms");
    if (multiplier < 1.0)
      badKey("retry.backoff_multiplier", "must be >= 1.0");

    retry.maxAttempts = static_cast<unsigned>(attempts);
    retry.initialBackoff = std::chrono::milliseconds{ initialMs };
    retry.maxBackoff = std::chrono::milliseconds{ maxMs };
    retry.backoffMultiplier = multiplier;
    return retry;
  }

} // namespace

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

EngineConfig ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  std::ostringstream text;
  text << in.rdbuf();
  return fromText(text.str());
}

EngineConfig ConfigLoader::fromText(const std::string& jsonText) {
  json doc;
  try {
    doc = json::parse(jsonText);
  } catch (const json::parse_error& e) {
    throw std::runtime_error(std::string("[ConfigLoader] parse error: ") + e.what());
  }
  if (!doc.is_object())
    throw std::runtime_error("[ConfigLoader] top-level value must be an object");

  EngineConfig cfg;
  readOptional(doc, "database_path", cfg.databasePath);
  readOptional(doc, "event_log_path", cfg.eventLogPath);
  readOptional(doc, "notifier", cfg.notifier);
  readOptional(doc, "notification_body", cfg.notificationBody);

  if (cfg.databasePath.empty())
    badKey("database_path", "must not be empty");
  if (cfg.notifier.empty())
    badKey("notifier", "must not be empty");

  std::string overdue = toString(cfg.overdue);
  readOptional(doc, "overdue_policy", overdue);
  cfg.overdue = parseOverdue(overdue);

  if (auto it = doc.find("retry"); it != doc.end())
    cfg.retry = parseRetry(*it);

  return cfg;
}
