#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Public API for chime::core::SystemCoordinator.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <iosfwd>
#include <memory>
#include <stop_token>
#include <string>

#include "core/ConfigLoader.hpp"

namespace chime {
  namespace io {
    class AlarmStore;
  } // namespace io

  namespace core {

    class AlarmRepository;
    class AlarmScheduler;
    class AlarmService;
    class Clock;
    class ErrorMonitor;
    class Logger;
    class NotifierFactory;
    class NotifierGateway;
    class RecoveryCoordinator;

    /**
 * @class SystemCoordinator
 * @brief Owns the whole object graph for one process lifetime.
 *
 *  * BOOT → INIT (`initialize`: store, event log, notifier, recovery) → IDLE
 *    (`run`: console loop) → FINISHED (`shutdown`).  Any failure → ERROR.
 *  * Exactly one scheduler instance, handed by reference to the service and
 *    to recovery; nothing is reachable through globals.
 */
    class SystemCoordinator {

    public:
      /// \p out receives console output and console-notifier toasts.
      SystemCoordinator(EngineConfig config, std::ostream& out);
      /// Test seam: caller supplies the store and the clock.
      SystemCoordinator(EngineConfig config, std::ostream& out, std::shared_ptr<io::AlarmStore> store,
                        std::shared_ptr<Clock> clock);
      ~SystemCoordinator(); ///< shutdown()

      void initialize();                        ///< build + recover; throws on failure
      bool run(int inFd, std::stop_token stop); ///< console loop; true if the operator quit
      void shutdown();                          ///< cancel waits, flush event log
      void handleError(const std::string& reason);

      AlarmService& service();

      SystemCoordinator(const SystemCoordinator&) = delete;
      SystemCoordinator& operator=(const SystemCoordinator&) = delete;

    private:
      enum class State { BOOT, INIT, IDLE, FINISHED, ERROR };

      void transitionTo(State next);
      void registerNotifiers();

      EngineConfig config_;
      std::ostream& out_;
      State currentState_{ State::BOOT };

      std::shared_ptr<Clock> clock_;
      std::shared_ptr<io::AlarmStore> store_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> logger_;
      std::unique_ptr<NotifierFactory> notifiers_;
      std::shared_ptr<NotifierGateway> gateway_;
      std::unique_ptr<AlarmRepository> repository_;
      std::unique_ptr<AlarmScheduler> scheduler_;
      std::unique_ptr<RecoveryCoordinator> recovery_;
      std::unique_ptr<AlarmService> service_;
    };

  } // namespace core
} // namespace chime
