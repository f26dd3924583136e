/* @file TimeUtil.cpp
 * @brief UTC formatting helpers built on timegm / gmtime_r.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdio>
#include <ctime>

// Chime headers
#include "core/TimeUtil.hpp"

namespace chime {
  namespace core {

    std::int64_t toEpochMillis(Instant t) {
      return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    }

    Instant fromEpochMillis(std::int64_t ms) {
      return Instant{ std::chrono::duration_cast<Instant::duration>(std::chrono::milliseconds{ ms }) };
    }

    std::string formatUtc(Instant t) {
      std::time_t secs = std::chrono::system_clock::to_time_t(t);
      std::tm tm{};
      gmtime_r(&secs, &tm);

      char buf[32];
      std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
      return buf;
    }

    std::optional<Instant> parseUtc(const std::string& text) {
      std::tm tm{};
      int consumed = 0;
      int n = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2dZ%n", &tm.tm_year, &tm.tm_mon,
                          &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed);
      if (n != 6 || consumed != static_cast<int>(text.size()))
        return std::nullopt;

      if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31 || tm.tm_hour > 23 ||
          tm.tm_min > 59 || tm.tm_sec > 60)
        return std::nullopt;

      tm.tm_year -= 1900;
      tm.tm_mon -= 1;
      std::time_t secs = timegm(&tm);
      if (secs == static_cast<std::time_t>(-1))
        return std::nullopt;
      return std::chrono::system_clock::from_time_t(secs);
    }

  } // namespace core
} // namespace chime
