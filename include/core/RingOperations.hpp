#pragma once
/** @file  RingOperations.hpp
 *  @brief Driver-facing units of work performed while holding a RingSession.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <string>

// Zeddring headers
#include "core/Errors.hpp"
#include "core/Types.hpp"

namespace zeddring::drivers {
  class GuardedDriver;
}

namespace zeddring::core {

  class ErrorMonitor;
  class RingRegistry;
  class RingSession;
  class TelemetryStore;
  class TimeSource;

  /**
 * @class RingOperations
 * @brief Connect / poll / clock / reboot / disconnect for one locked ring.
 *
 *  * Every method requires a live RingSession; none of them locks anything
 *    per ring.
 *  * core::TransportError is caught here and becomes a state transition.
 *    The returned ErrorKind tells API callers what happened.
 *  * core::StorageError is *not* caught: callers escalate it.
 */
  class RingOperations {
  public:
    RingOperations(drivers::GuardedDriver& driver, RingRegistry& registry, TelemetryStore& store,
                   ErrorMonitor& errors, const TimeSource& clock, bool syncTimeOnConnect);

    /// Disconnected/Backoff -> Connecting -> Connected | Backoff (+ clock sync).
    ErrorKind connect(RingSession& session);

    /// Battery, steps, heart rate, in that order. Stops at the first failure.
    ErrorKind poll(RingSession& session);

    ErrorKind setTime(RingSession& session);
    ErrorKind reboot(RingSession& session);

    /// Drop the link if there is one, then force Disconnected.
    void disconnect(RingSession& session, const std::string& reason);

    /// Scan and register unseen rings whose advertised name starts with \p prefix.
    std::size_t discover(std::chrono::seconds scanTimeout, const std::string& prefix);

    static std::string attentionMessage(RingId id);

  private:
    ErrorKind linkFailure(RingSession& session, const TransportError& ex);

    drivers::GuardedDriver& driver_;
    RingRegistry& registry_;
    TelemetryStore& store_;
    ErrorMonitor& errors_;
    const TimeSource& clock_;
    bool syncTimeOnConnect_;
  };

} // namespace zeddring::core
