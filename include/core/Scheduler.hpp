#pragma once
/** @file  Scheduler.hpp
 *  @brief Fixed-cadence loop that connects, retries and polls every ring.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>
#include <vector>

// Zeddring headers
#include "core/ConfigLoader.hpp"
#include "core/Types.hpp"
#include "core/WorkerPool.hpp"

namespace zeddring {
  namespace core {

    class ErrorMonitor;
    class OperationLocks;
    class RingOperations;
    class RingRegistry;
    class RingSession;
    class TimeSource;

    /**
 * @class Scheduler
 * @brief Owns the tick thread and the worker pool; holds references to
 *        everything else (built once by SystemCoordinator).
 *
 *  * A tick never waits on a ring: busy rings are skipped, free ones are
 *    locked on the tick thread and the session is handed to a worker.
 *  * Per-ring failures end in the state machine; only StorageError
 *    escalates (fatal).
 *  * `tick()` + `waitIdle()` are public so tests can drive it synchronously.
 */
    class Scheduler {

    public:
      Scheduler(RingRegistry& registry, OperationLocks& locks, RingOperations& ops,
                ErrorMonitor& errors, const AppConfig& config, const TimeSource& clock);
      ~Scheduler(); ///< stop()

      Scheduler(const Scheduler&) = delete;
      Scheduler& operator=(const Scheduler&) = delete;

      // --- public API ---
      void start(); ///< launch the tick thread
      void stop();  ///< join tick thread, drain workers, drop every link

      /// One scheduling pass. Returns the number of ring jobs dispatched.
      std::size_t tick();

      /// Block until every dispatched job has finished.
      void waitIdle();

      bool running() const { return running_; }

    private:
      void loop();
      void runJob(RingSession& session);
      std::vector<Ring> dispatchOrder() const;
      void disconnectAll();

      RingRegistry& registry_;
      OperationLocks& locks_;
      RingOperations& ops_;
      ErrorMonitor& errors_;
      AppConfig config_;
      const TimeSource& clock_;

      WorkerPool pool_;
      std::thread thread_;
      std::mutex mtx_;
      std::condition_variable wake_;
      std::atomic<bool> running_{ false };
    };

  } // namespace core
} // namespace zeddring
