#pragma once
/** @file  DesktopNotifier.hpp
 *  @brief freedesktop notification via the `notify-send` helper (POSIX spawn).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "io/Notifier.hpp"

namespace chime {
  namespace io {

    /**
 * @class DesktopNotifier
 * @brief Spawns `notify-send --app-name=<app> -- <title> <body>` and waits for it.
 *
 *  * Granted when the helper is on PATH and a session bus address is set.
 *  * Non-zero exit, signal or spawn failure throws `std::runtime_error`.
 */
    class DesktopNotifier : public Notifier {
    public:
      explicit DesktopNotifier(std::string program = "notify-send", std::string appName = "chime");

      void display(const std::string& title, const std::string& body) override;
      bool isGranted() const override;
      bool request() override;

    private:
      bool programOnPath() const;

      std::string program_;
      std::string appName_;
    };

  } // namespace io
} // namespace chime
