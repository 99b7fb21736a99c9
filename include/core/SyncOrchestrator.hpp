#pragma once
/** @file  SyncOrchestrator.hpp
 *  @brief On-demand bulk history pull, serialized with the poller per ring.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <cstddef>

// Zeddring headers
#include "core/Errors.hpp"
#include "core/Types.hpp"

namespace zeddring::drivers {
  class GuardedDriver;
}

namespace zeddring::core {

  class OperationLocks;
  class TelemetryStore;
  class TimeSource;

  struct SyncResult {
    CommandResult status{};
    std::size_t stepsWritten{ 0 };
    std::size_t heartRateWritten{ 0 };
  };

  /**
 * @class SyncOrchestrator
 * @brief Reads the ring's stored history and writes it in one batch.
 *
 *  * Waits for the ring's operation lock, so it never overlaps a poll.
 *  * Samples keep the timestamps the ring recorded them with. Running it
 *    twice stores duplicates; daily min/max do not move.
 *  * Heart-rate zeros (ring not worn) are dropped.
 *  * @throws StorageError if the batch cannot be journaled.
 */
  class SyncOrchestrator {
  public:
    SyncOrchestrator(OperationLocks& locks, drivers::GuardedDriver& driver, TelemetryStore& store,
                     const TimeSource& clock);

    SyncResult syncHistory(RingId id);

  private:
    OperationLocks& locks_;
    drivers::GuardedDriver& driver_;
    TelemetryStore& store_;
    const TimeSource& clock_;
  };

} // namespace zeddring::core
