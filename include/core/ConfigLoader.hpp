#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "core/SchedulePolicy.hpp"

namespace chime::core {

  /// Validated engine settings; every field has a usable default.
  struct EngineConfig {
    std::string databasePath{ "chime.db" };
    std::string eventLogPath{ "chime-events.csv" };
    std::string notifier{ "console" };
    std::string notificationBody{ "Alarm" };
    OverduePolicy overdue{ OverduePolicy::FireImmediately };
    RetryPolicy retry{};
  };

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and maps it onto `EngineConfig`.
 *
 *  * No caching; every call to `load()` re-reads the file.
 *  * Missing keys keep their defaults; wrong types or out-of-range values throw
 *    `std::runtime_error` naming the offending key.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse and validate the file or throw `std::runtime_error`.
    EngineConfig load() const;

    /// Validation half of `load()`, usable on an in-memory document.
    static EngineConfig fromText(const std::string& jsonText);

  private:
    std::string path_;
  };

} // namespace chime::core
