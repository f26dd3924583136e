#pragma once
/** @file  TimeUtil.hpp
 *  @brief Instant <-> epoch-millis / ISO-8601 (UTC) conversions.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>

// Chime headers
#include "core/Alarm.hpp"

namespace chime {
  namespace core {

    /// Milliseconds since the Unix epoch, the on-disk representation of an Instant.
    std::int64_t toEpochMillis(Instant t);
    Instant fromEpochMillis(std::int64_t ms);

    /// Formats as `YYYY-MM-DDTHH:MM:SSZ` (sub-second part dropped).
    std::string formatUtc(Instant t);

    /// Parses `YYYY-MM-DDTHH:MM:SSZ`; std::nullopt on any malformed input.
    std::optional<Instant> parseUtc(const std::string& text);

  } // namespace core
} // namespace chime
