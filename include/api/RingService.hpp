#pragma once
/** @file  RingService.hpp
 *  @brief Command/query facade the dashboard drives (through CommandDispatcher).
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <vector>

// Zeddring headers
#include "core/Errors.hpp"
#include "core/SyncOrchestrator.hpp"
#include "core/TelemetryStore.hpp"
#include "core/Types.hpp"

namespace zeddring::core {
  class ErrorMonitor;
  class OperationLocks;
  class RingOperations;
  class RingRegistry;
} // namespace zeddring::core

namespace zeddring::api {

  /**
 * @class RingService
 * @brief Every command returns a core::CommandResult; none throws for an
 *        expected failure.
 *
 *  * Commands that touch the device take the ring's operation lock, so they
 *    queue behind an in-flight poll or sync instead of racing it.
 *  * `disconnectRing` is the exception: a busy ring gets the request recorded
 *    and the holder applies it on release.
 *  * core::StorageError is escalated to ErrorMonitor::fatal().
 */
  class RingService {
  public:
    RingService(core::RingRegistry& registry, core::OperationLocks& locks,
                core::RingOperations& ops, core::SyncOrchestrator& sync,
                core::TelemetryStore& store, core::ErrorMonitor& errors);

    //---commands---------------------------------------------------------
    core::CommandResult registerRing(const std::string& address,
                                     const std::optional<std::string>& name = std::nullopt);
    core::CommandResult renameRing(core::RingId id, const std::string& name);
    core::CommandResult removeRing(core::RingId id);
    core::CommandResult connectRing(core::RingId id);
    core::CommandResult disconnectRing(core::RingId id);
    core::SyncResult syncRing(core::RingId id);
    core::CommandResult setRingTime(core::RingId id);
    core::CommandResult rebootRing(core::RingId id);

    //---queries----------------------------------------------------------
    std::vector<core::Ring> listRings() const;
    std::optional<core::Ring> getRing(core::RingId id) const;

    /// @throws core::RingError InvalidArgument when since > until
    core::SampleCursor rangeQuery(core::RingId id, core::Metric metric, core::Timestamp since,
                                  core::Timestamp until) const;
    /// @throws core::RingError InvalidArgument when since > until
    std::vector<core::DayAggregate> aggregateByDay(core::RingId id, core::Metric metric,
                                                   core::Timestamp since,
                                                   core::Timestamp until) const;

  private:
    template <typename Fn> core::CommandResult guarded(const char* op, Fn&& fn);
    static core::CommandResult fromKind(core::ErrorKind kind, const core::RingStatus& status,
                                        const std::string& okMessage);

    core::RingRegistry& registry_;
    core::OperationLocks& locks_;
    core::RingOperations& ops_;
    core::SyncOrchestrator& sync_;
    core::TelemetryStore& store_;
    core::ErrorMonitor& errors_;
  };

} // namespace zeddring::api
