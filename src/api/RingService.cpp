/* @file RingService.cpp
 * @brief dashboard commands -> registry / locks / ring operations
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// Third-party headers
#include <spdlog/spdlog.h>

// Zeddring headers
#include "api/RingService.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/OperationLocks.hpp"
#include "core/RingOperations.hpp"
#include "core/RingRegistry.hpp"

using namespace zeddring::api;
using namespace zeddring::core;

namespace {

  void requireOrdered(Timestamp since, Timestamp until) {
    if (since > until)
      throw RingError(ErrorKind::InvalidArgument, "[Service] 'since' is after 'until'");
  }

} // namespace

RingService::RingService(RingRegistry& registry, OperationLocks& locks, RingOperations& ops,
                         SyncOrchestrator& sync, TelemetryStore& store, ErrorMonitor& errors)
    : registry_(registry), locks_(locks), ops_(ops), sync_(sync), store_(store), errors_(errors) {}

template <typename Fn> CommandResult RingService::guarded(const char* op, Fn&& fn) {
  try {
    return fn();
  } catch (const RingError& ex) {
    spdlog::debug("[Service] {} rejected: {}", op, ex.what());
    return CommandResult::failure(ex.kind(), ex.what());
  } catch (const StorageError& ex) {
    errors_.fatal(std::string("[Service] ") + op + ": " + ex.what());
  }
}

CommandResult RingService::fromKind(ErrorKind kind, const RingStatus& status,
                                    const std::string& okMessage) {
  if (kind == ErrorKind::None)
    return CommandResult::success(okMessage);
  if (kind == ErrorKind::DeviceUnavailable)
    return CommandResult::failure(kind, "ring is " + std::string(toString(status.state)) +
                                            ", not Connected");
  if (kind == ErrorKind::Cancelled)
    return CommandResult::failure(kind, "ring was removed");
  return CommandResult::failure(kind, status.lastError.empty() ? toString(kind) : status.lastError);
}

//---commands---------------------------------------------------------------
CommandResult RingService::registerRing(const std::string& address,
                                        const std::optional<std::string>& name) {
  return guarded("registerRing", [&] {
    const RingId id = registry_.registerRing(address, name);
    auto result = CommandResult::success("registered ring " + std::to_string(id));
    result.ringId = id;
    return result;
  });
}

CommandResult RingService::renameRing(RingId id, const std::string& name) {
  return guarded("renameRing", [&] {
    registry_.rename(id, name);
    auto result = CommandResult::success("renamed");
    result.ringId = id;
    return result;
  });
}

CommandResult RingService::removeRing(RingId id) {
  return guarded("removeRing", [&] {
    registry_.remove(id);
    locks_.retire(id);
    spdlog::info("[Service] ring {} removed", id);
    auto result = CommandResult::success("removed");
    result.ringId = id;
    return result;
  });
}

CommandResult RingService::connectRing(RingId id) {
  return guarded("connectRing", [&] {
    auto session = locks_.acquire(id);
    if (session.fsm().state() == ConnectionState::Connected) {
      auto result = CommandResult::success("already connected");
      result.ringId = id;
      return result;
    }
    const auto kind = ops_.connect(session);
    auto result = fromKind(kind, session.fsm().status(), "connected");
    result.ringId = id;
    return result;
  });
}

CommandResult RingService::disconnectRing(RingId id) {
  return guarded("disconnectRing", [&] {
    auto session = locks_.acquireOrRequestDisconnect(id);
    auto result = CommandResult::success("disconnect requested, applied when the ring is released");
    if (session) {
      ops_.disconnect(session, "disconnected by user");
      result.message = "disconnected";
    }
    result.ringId = id;
    return result;
  });
}

SyncResult RingService::syncRing(RingId id) {
  try {
    return sync_.syncHistory(id);
  } catch (const StorageError& ex) {
    errors_.fatal(std::string("[Service] syncRing: ") + ex.what());
  }
}

CommandResult RingService::setRingTime(RingId id) {
  return guarded("setRingTime", [&] {
    auto session = locks_.acquire(id);
    auto result = fromKind(ops_.setTime(session), session.fsm().status(), "clock set");
    result.ringId = id;
    return result;
  });
}

CommandResult RingService::rebootRing(RingId id) {
  return guarded("rebootRing", [&] {
    auto session = locks_.acquire(id);
    auto result = fromKind(ops_.reboot(session), session.fsm().status(), "rebooting");
    result.ringId = id;
    return result;
  });
}

//---queries----------------------------------------------------------------
std::vector<Ring> RingService::listRings() const { return registry_.list(); }

std::optional<Ring> RingService::getRing(RingId id) const {
  auto ring = registry_.get(id);
  if (!ring || ring->pendingDeletion)
    return std::nullopt;
  return ring;
}

SampleCursor RingService::rangeQuery(RingId id, Metric metric, Timestamp since,
                                     Timestamp until) const {
  requireOrdered(since, until);
  return store_.rangeQuery(id, metric, since, until);
}

std::vector<DayAggregate> RingService::aggregateByDay(RingId id, Metric metric, Timestamp since,
                                                      Timestamp until) const {
  requireOrdered(since, until);
  return store_.aggregateByDay(id, metric, since, until);
}
