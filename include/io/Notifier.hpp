#pragma once
/** @file  Notifier.hpp
 *  @brief Abstract base class for every notification back-end.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

namespace chime::io {

  /**
 * @class Notifier
 * @brief Common polymorphic interface that every concrete toast/desktop
 *        notifier must implement.
 *
 *  * Runs synchronously on the caller’s thread (a scheduler worker).
 *  * Keeps no retry state; the scheduler owns retries.
 */
  class Notifier {
  public:
    virtual ~Notifier() = default;

    /**
     * @brief Show one notification.
     *
     * @param title  Alarm label.
     * @param body   Message text under the title.
     * @throws std::runtime_error (or a subclass) if the back-end refused it.
     */
    virtual void display(const std::string& title, const std::string& body) = 0;

    /// True if the back-end is allowed to show notifications right now.
    virtual bool isGranted() const = 0;

    /// Ask for permission; returns the resulting grant state.
    virtual bool request() = 0;
  };

} // namespace chime::io
