#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Builds every component once, runs scheduler + control channel, tears down.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "core/ConfigLoader.hpp"
#include "drivers/DriverFactory.hpp"

namespace zeddring::api {
  class CommandDispatcher;
  class RingService;
} // namespace zeddring::api

namespace zeddring::drivers {
  class GuardedDriver;
}

namespace zeddring::io {
  class SerialChannel;
}

namespace zeddring {
  namespace core {

    class ErrorMonitor;
    class OperationLocks;
    class RingOperations;
    class RingRegistry;
    class Scheduler;
    class SyncOrchestrator;
    class TelemetryStore;
    class TimeSource;

    /**
 * @class SystemCoordinator
 * @brief The only place that knows every concrete type.
 *
 *    BOOT -> INIT -> RUNNING -> STOPPING -> FINISHED
 *      any failure in initialize()/start() -> ERROR
 *
 *  * The control channel is one JSON request per line on \p controlIn,
 *    answered on \p controlOut (stdin/stdout for the daemon).
 *  * `run()` blocks until SIGINT/SIGTERM; the caller must have blocked both
 *    signals in every thread before calling it.
 */
    class SystemCoordinator {

    public:
      enum class State { BOOT, INIT, RUNNING, STOPPING, FINISHED, ERROR };

      SystemCoordinator(AppConfig config, int controlIn, int controlOut,
                        drivers::DriverFactory factory = drivers::DriverFactory::withBuiltins());
      ~SystemCoordinator();

      SystemCoordinator(const SystemCoordinator&) = delete;
      SystemCoordinator& operator=(const SystemCoordinator&) = delete;

      void initialize(); ///< data dir, registry, store, driver, wiring
      void start();      ///< scheduler thread + control-channel thread
      int run();         ///< initialize + start + wait for a signal + shutdown
      void shutdown();   ///< idempotent
      void handleError(const std::string& reason);

      State state() const { return currentState_; }
      api::RingService& service();

    private:
      void transitionTo(State next);
      void controlLoop();

      AppConfig config_;
      int controlIn_;
      int controlOut_;
      drivers::DriverFactory factory_;

      std::unique_ptr<ErrorMonitor> errors_;
      std::unique_ptr<TimeSource> clock_;
      std::unique_ptr<RingRegistry> registry_;
      std::unique_ptr<TelemetryStore> store_;
      std::unique_ptr<drivers::DeviceDriver> driver_;
      std::unique_ptr<drivers::GuardedDriver> guarded_;
      std::unique_ptr<OperationLocks> locks_;
      std::unique_ptr<RingOperations> ops_;
      std::unique_ptr<SyncOrchestrator> sync_;
      std::unique_ptr<api::RingService> service_;
      std::unique_ptr<api::CommandDispatcher> dispatcher_;
      std::unique_ptr<Scheduler> scheduler_;
      std::unique_ptr<io::SerialChannel> control_;

      std::thread controlThread_;
      std::atomic<bool> controlRunning_{ false };
      std::atomic<State> currentState_{ State::BOOT };
    };

    inline const char* toString(SystemCoordinator::State s) {
      switch (s) {
      case SystemCoordinator::State::BOOT:
        return "BOOT";
      case SystemCoordinator::State::INIT:
        return "INIT";
      case SystemCoordinator::State::RUNNING:
        return "RUNNING";
      case SystemCoordinator::State::STOPPING:
        return "STOPPING";
      case SystemCoordinator::State::FINISHED:
        return "FINISHED";
      case SystemCoordinator::State::ERROR:
        return "ERROR";
      default:
        return "Unknown";
      }
    }

  } // namespace core
} // namespace zeddring
