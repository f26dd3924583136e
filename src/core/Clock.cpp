/* @file Clock.cpp
 * @brief system_clock sleeps that wake early on stop requests.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <condition_variable>
#include <mutex>

// Chime headers
#include "core/Clock.hpp"

using namespace chime::core;

Instant SystemClock::now() const { return std::chrono::system_clock::now(); }

bool SystemClock::sleepUntil(Instant deadline, std::stop_token stop) {
  std::mutex mtx;
  std::condition_variable_any cv;
  std::unique_lock lock(mtx);

  // wait_until can return spuriously or after a wall-clock jump, so loop on the clock itself
  while (std::chrono::system_clock::now() < deadline) {
    cv.wait_until(lock, stop, deadline, [] { return false; });
    if (stop.stop_requested())
      return false;
  }
  return true;
}
