/* @file main.cpp
 * @brief chimed entry point: config → SystemCoordinator → console until quit or SIGINT/SIGTERM
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <condition_variable>
#include <cstring>
#include <exception>
#include <iostream>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

// Linux headers
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

// Chime headers
#include "core/ConfigLoader.hpp"
#include "core/SystemCoordinator.hpp"

namespace {

  void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [config.json]\n"
              << "  without a config file the defaults are used (chime.db, console notifier)\n";
  }

} // namespace

int main(int argc, char** argv) {
  if (argc > 2 || (argc == 2 && (std::strcmp(argv[1], "-h") == 0 ||
                                 std::strcmp(argv[1], "--help") == 0))) {
    usage(argv[0]);
    return argc > 2 ? 2 : 0;
  }

  // block before any thread exists so every worker inherits the mask
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  if (int rc = pthread_sigmask(SIG_BLOCK, &signals, nullptr); rc != 0) {
    std::cerr << "[chimed] pthread_sigmask: " << std::strerror(rc) << "\n";
    return 1;
  }

  chime::core::EngineConfig config;
  try {
    if (argc == 2)
      config = chime::core::ConfigLoader(argv[1]).load();
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  std::stop_source stop;
  std::jthread signalWatcher([&stop, signals](std::stop_token self) {
    // sigtimedwait so the watcher can notice its own stop request on exit
    const timespec tick{ 0, 200 * 1000 * 1000 };
    while (!self.stop_requested()) {
      if (sigtimedwait(&signals, nullptr, &tick) > 0) {
        stop.request_stop();
        return;
      }
    }
  });

  try {
    chime::core::SystemCoordinator coordinator(config, std::cout);
    coordinator.initialize();
    if (!coordinator.run(STDIN_FILENO, stop.get_token())) {
      // stdin closed (e.g. started from a service manager): keep firing until signalled
      std::mutex mtx;
      std::condition_variable_any idle;
      std::unique_lock lock(mtx);
      idle.wait(lock, stop.get_token(), [] { return false; });
    }
    coordinator.shutdown();
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  return 0;
}
