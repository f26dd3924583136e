#pragma once
/** @file  ConsoleController.hpp
 *  @brief Line-oriented operator console for the alarm daemon.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <iosfwd>
#include <stop_token>
#include <string>

#include "core/Alarm.hpp"

namespace chime {
  namespace core { // forward decls so we don’t pull core headers in
    class AlarmService;
    class Clock;
  } // namespace core

  namespace ui {

    /** One parsed console line. */
    struct ConsoleCommand {
      enum class Kind {
        Add,
        List,
        Delete,
        On,
        Off,
        Help,
        Quit,
        Empty,
        Invalid,
      };

      Kind kind{ Kind::Empty };
      core::AlarmId id{ 0 };
      core::Instant when{};
      std::string title{};
      std::string error{}; ///< set for Kind::Invalid
    };

    /**
 * @class ConsoleController
 * @brief Reads commands from an fd, drives AlarmService, prints results.
 *
 * * `add <+seconds|YYYY-MM-DDTHH:MM:SSZ> <title...>`, `list`, `delete <id>`,
 *   `on <id>`, `off <id>`, `help`, `quit`.
 * * A failing command prints `error: ...` and the console keeps going.
 */
    class ConsoleController {

    public:
      ConsoleController(core::AlarmService& service, core::Clock& clock, int inFd,
                        std::ostream& out);

      // ---- public API ----------------------------------------------------------
      /// Serve until `quit`, EOF on the input fd, or \p stop is requested.
      /// @returns true only if the operator typed `quit`.
      bool serve(std::stop_token stop);

      /// Execute one line.  @returns false if the line asked to quit.
      bool handleLine(const std::string& line);

      /// Pure parser; relative times are resolved against \p now.
      static ConsoleCommand parse(const std::string& line, core::Instant now);

    private:
      void printList();
      void printHelp();

      static constexpr std::chrono::milliseconds kPollInterval{ 200 };

      core::AlarmService& service_;
      core::Clock& clock_;
      int inFd_;
      std::ostream& out_;
    };

  } // namespace ui
} // namespace chime
