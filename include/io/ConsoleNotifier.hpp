#pragma once
/** @file  ConsoleNotifier.hpp
 *  @brief Notifier that prints the toast to a std::ostream.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <iosfwd>
#include <mutex>

#include "io/Notifier.hpp"

namespace chime {
  namespace io {

    /// Headless fallback.  Always granted; fails only if the stream is bad.
    class ConsoleNotifier : public Notifier {
    public:
      explicit ConsoleNotifier(std::ostream& out);

      void display(const std::string& title, const std::string& body) override;
      bool isGranted() const override { return true; }
      bool request() override { return true; }

    private:
      std::ostream& out_;
      std::mutex mtx_; ///< workers for different alarms may fire together
    };

  } // namespace io
} // namespace chime
