/* @file SystemCoordinator.cpp
 * @brief wires store, notifier, scheduler, recovery and console for one process
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>

// Chime headers
#include "core/AlarmRepository.hpp"
#include "core/AlarmScheduler.hpp"
#include "core/AlarmService.hpp"
#include "core/Clock.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/NotifierFactory.hpp"
#include "core/NotifierGateway.hpp"
#include "core/RecoveryCoordinator.hpp"
#include "core/SystemCoordinator.hpp"
#include "io/ConsoleNotifier.hpp"
#include "io/DesktopNotifier.hpp"
#include "io/SqliteAlarmStore.hpp"
#include "ui/ConsoleController.hpp"

using namespace chime::core;

SystemCoordinator::SystemCoordinator(EngineConfig config, std::ostream& out)
    : SystemCoordinator(std::move(config), out, nullptr, nullptr) {}

SystemCoordinator::SystemCoordinator(EngineConfig config, std::ostream& out,
                                     std::shared_ptr<io::AlarmStore> store,
                                     std::shared_ptr<Clock> clock)
    : config_(std::move(config)), out_(out), clock_(std::move(clock)), store_(std::move(store)) {}

SystemCoordinator::~SystemCoordinator() { shutdown(); }

void SystemCoordinator::initialize() {
  if (currentState_ != State::BOOT)
    throw std::logic_error("[SystemCoordinator] initialize() called twice");
  transitionTo(State::INIT);

  try {
    if (!clock_)
      clock_ = std::make_shared<SystemClock>();
    if (!store_)
      store_ = std::make_shared<io::SqliteAlarmStore>(config_.databasePath);

    errorMonitor_ = std::make_shared<ErrorMonitor>();
    errorMonitor_->registerEscalation([this](const std::string& msg) { handleError(msg); });

    logger_ = std::make_shared<Logger>();
    if (!config_.eventLogPath.empty())
      logger_->start(config_.eventLogPath); // failure already reported; run without a journal

    notifiers_ = std::make_unique<NotifierFactory>();
    registerNotifiers();
    gateway_ = std::make_shared<NotifierGateway>(notifiers_->create(config_.notifier));

    SchedulerOptions options;
    options.overdue = config_.overdue;
    options.retry = config_.retry;
    options.notificationBody = config_.notificationBody;

    repository_ = std::make_unique<AlarmRepository>(store_, *clock_);
    scheduler_ = std::make_unique<AlarmScheduler>(*clock_, gateway_, errorMonitor_, logger_, options);
    recovery_ = std::make_unique<RecoveryCoordinator>(*repository_, *scheduler_, *clock_,
                                                      errorMonitor_, logger_);
    service_ = std::make_unique<AlarmService>(*repository_, *scheduler_, *recovery_, gateway_,
                                              *clock_, logger_);

    const std::size_t recovered = service_->start();
    out_ << "chime: " << recovered << " alarm(s) recovered, notifier '" << config_.notifier
         << "', overdue policy " << toString(config_.overdue) << "\n";
  } catch (const std::exception& e) {
    transitionTo(State::ERROR);
    throw std::runtime_error(std::string("[SystemCoordinator] initialize failed: ") + e.what());
  }

  transitionTo(State::IDLE);
}

bool SystemCoordinator::run(int inFd, std::stop_token stop) {
  if (currentState_ != State::IDLE)
    throw std::logic_error("[SystemCoordinator] run() before initialize()");

  ui::ConsoleController console(*service_, *clock_, inFd, out_);
  return console.serve(stop);
}

void SystemCoordinator::shutdown() {
  if (currentState_ == State::FINISHED)
    return;

  // workers call into the repository and the logger, so stop them first
  if (scheduler_)
    scheduler_->cancelAll();
  if (logger_)
    logger_->stop();
  transitionTo(State::FINISHED);
}

void SystemCoordinator::handleError(const std::string& reason) {
  std::cerr << "[chime] " << reason << "\n";
}

AlarmService& SystemCoordinator::service() {
  if (!service_)
    throw std::logic_error("[SystemCoordinator] service() before initialize()");
  return *service_;
}

void SystemCoordinator::transitionTo(State next) { currentState_ = next; }

void SystemCoordinator::registerNotifiers() {
  std::ostream& out = out_;
  notifiers_->registerNotifier("console",
                               [&out] { return std::make_shared<io::ConsoleNotifier>(out); });
  notifiers_->registerNotifier("desktop", [] { return std::make_shared<io::DesktopNotifier>(); });
}
