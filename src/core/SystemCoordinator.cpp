/* @file SystemCoordinator.cpp
 * @brief component wiring, lifecycle FSM and the control-channel loop
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <utility>

// Linux headers
#include <signal.h>

// Third-party headers
#include <spdlog/spdlog.h>

// Zeddring headers
#include "api/CommandDispatcher.hpp"
#include "api/RingService.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/OperationLocks.hpp"
#include "core/RingOperations.hpp"
#include "core/RingRegistry.hpp"
#include "core/Scheduler.hpp"
#include "core/SyncOrchestrator.hpp"
#include "core/SystemCoordinator.hpp"
#include "core/TelemetryStore.hpp"
#include "core/TimeSource.hpp"
#include "drivers/GuardedDriver.hpp"
#include "io/SerialChannel.hpp"

using namespace zeddring::core;

namespace {
  constexpr std::chrono::milliseconds kControlPoll{ 200 };
}

SystemCoordinator::SystemCoordinator(AppConfig config, int controlIn, int controlOut,
                                     drivers::DriverFactory factory)
    : config_(std::move(config)), controlIn_(controlIn), controlOut_(controlOut),
      factory_(std::move(factory)) {}

SystemCoordinator::~SystemCoordinator() { shutdown(); }

void SystemCoordinator::transitionTo(State next) {
  spdlog::debug("[Coordinator] {} -> {}", toString(currentState_.load()), toString(next));
  currentState_ = next;
}

void SystemCoordinator::initialize() {
  if (currentState_ != State::BOOT)
    throw std::logic_error("[Coordinator] initialize() called twice");
  transitionTo(State::INIT);

  try {
    std::filesystem::create_directories(config_.dataDir);

    errors_ = std::make_unique<ErrorMonitor>();
    errors_->registerEscalation(
        [](const std::string& msg) { spdlog::error("[Coordinator] needs attention: {}", msg); });
    clock_ = std::make_unique<SystemTimeSource>();

    registry_ = std::make_unique<RingRegistry>(config_.registryPath(), config_.defaultRingName);
    registry_->load();
    store_ = TelemetryStore::open(config_.telemetryPath());

    driver_ = factory_.create(config_.driver, config_);
    guarded_ = std::make_unique<drivers::GuardedDriver>(
        *driver_, std::chrono::duration_cast<std::chrono::milliseconds>(config_.operationTimeout));

    locks_ = std::make_unique<OperationLocks>(*registry_, *guarded_, config_.retryPolicy());
    ops_ = std::make_unique<RingOperations>(*guarded_, *registry_, *store_, *errors_, *clock_,
                                            config_.syncTimeOnConnect);
    sync_ = std::make_unique<SyncOrchestrator>(*locks_, *guarded_, *store_, *clock_);
    service_ = std::make_unique<api::RingService>(*registry_, *locks_, *ops_, *sync_, *store_,
                                                  *errors_);
    dispatcher_ = std::make_unique<api::CommandDispatcher>(*service_);
    scheduler_ = std::make_unique<Scheduler>(*registry_, *locks_, *ops_, *errors_, config_,
                                             *clock_);
  } catch (const std::exception& ex) {
    handleError(ex.what());
    throw;
  }

  spdlog::info("[Coordinator] {} ring(s) registered, {} sample(s) on disk, driver '{}'",
               registry_->list().size(), store_->size(), config_.driver);
}

void SystemCoordinator::start() {
  if (currentState_ != State::INIT)
    throw std::logic_error("[Coordinator] start() requires initialize()");

  control_ = std::make_unique<io::SerialChannel>();
  control_->attach(controlIn_, controlOut_);
  controlRunning_ = true;
  controlThread_ = std::thread([this] { controlLoop(); });

  scheduler_->start();
  transitionTo(State::RUNNING);
}

int SystemCoordinator::run() {
  initialize();
  start();

  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  int received = 0;
  if (sigwait(&signals, &received) != 0) {
    handleError("sigwait failed");
    shutdown();
    return 1;
  }
  spdlog::info("[Coordinator] signal {} received, shutting down", received);
  shutdown();
  return 0;
}

void SystemCoordinator::shutdown() {
  const State s = currentState_;
  if (s == State::BOOT || s == State::STOPPING || s == State::FINISHED)
    return;
  const bool failed = s == State::ERROR;
  transitionTo(State::STOPPING);

  controlRunning_ = false;
  if (controlThread_.joinable())
    controlThread_.join();
  if (scheduler_)
    scheduler_->stop();

  transitionTo(failed ? State::ERROR : State::FINISHED);
  spdlog::info("[Coordinator] stopped");
}

void SystemCoordinator::handleError(const std::string& reason) {
  spdlog::error("[Coordinator] {}", reason);
  transitionTo(State::ERROR);
}

zeddring::api::RingService& SystemCoordinator::service() {
  if (!service_)
    throw std::logic_error("[Coordinator] service() before initialize()");
  return *service_;
}

void SystemCoordinator::controlLoop() {
  spdlog::debug("[Coordinator] control channel up");
  while (controlRunning_) {
    auto line = control_->readLine(kControlPoll);
    if (!line) {
      if (!control_->isOpen()) {
        spdlog::info("[Coordinator] control channel closed by peer");
        return;
      }
      continue;
    }
    if (line->empty())
      continue;
    if (!control_->writeLine(dispatcher_->handleLine(*line))) {
      spdlog::warn("[Coordinator] control channel write failed, closing it");
      return;
    }
  }
}
