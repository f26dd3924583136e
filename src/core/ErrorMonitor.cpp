/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault escalation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// Chime headers
#include "core/ErrorMonitor.hpp"

namespace chime {
  namespace core {

    ErrorMonitor::ErrorMonitor(std::size_t historyLimit)
        : historyLimit_(std::max<std::size_t>(1, historyLimit)) {}

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      if (!rememberIfNew(message))
        return;

      std::function<void(const std::string&)> cb;
      {
        std::lock_guard lock(mtx_);
        cb = escalation_;
      }
      if (cb)
        cb(message);
    }

    std::vector<std::string> ErrorMonitor::failures() const {
      std::lock_guard lock(mtx_);
      return { seen_.begin(), seen_.end() };
    }

    bool ErrorMonitor::rememberIfNew(const std::string& message) {
      std::lock_guard lock(mtx_);
      if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
        return false;
      seen_.push_back(message);
      if (seen_.size() > historyLimit_)
        seen_.pop_front();
      return true;
    }

  } // namespace core
} // namespace chime
