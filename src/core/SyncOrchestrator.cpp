/* @file SyncOrchestrator.cpp
 * @brief history pull -> single appendBatch
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <string>
#include <vector>

// Third-party headers
#include <spdlog/spdlog.h>

// Zeddring headers
#include "core/OperationLocks.hpp"
#include "core/SyncOrchestrator.hpp"
#include "core/TelemetryStore.hpp"
#include "core/TimeSource.hpp"
#include "drivers/GuardedDriver.hpp"

using namespace zeddring::core;

SyncOrchestrator::SyncOrchestrator(OperationLocks& locks, drivers::GuardedDriver& driver,
                                   TelemetryStore& store, const TimeSource& clock)
    : locks_(locks), driver_(driver), store_(store), clock_(clock) {}

SyncResult SyncOrchestrator::syncHistory(RingId id) {
  SyncResult result;

  RingSession session;
  try {
    session = locks_.acquire(id);
  } catch (const RingError& ex) {
    result.status = CommandResult::failure(ex.kind(), ex.what());
    return result;
  }

  auto& fsm = session.fsm();
  if (fsm.state() != ConnectionState::Connected) {
    result.status = CommandResult::failure(
        ErrorKind::DeviceUnavailable,
        "ring " + std::to_string(id) + " is " + toString(fsm.state()) + ", not Connected");
    return result;
  }

  fsm.contactAttempted(clock_.now());
  drivers::RingHistory history;
  try {
    history = driver_.readHistory(session.address());
  } catch (const TransportError& ex) {
    fsm.linkLost(clock_.now(), ex.what());
    result.status = CommandResult::failure(ex.kind(), ex.what());
    return result;
  }

  if (session.cancelled()) {
    spdlog::info("[Sync] ring {} removed during sync, history discarded", id);
    result.status = CommandResult::failure(ErrorKind::Cancelled,
                                           "ring " + std::to_string(id) + " was removed");
    return result;
  }

  std::vector<Sample> batch;
  batch.reserve(history.steps.size() + history.heartRate.size());
  for (const auto& rec : history.steps) {
    batch.push_back(Sample{ id, Metric::Steps, rec.timestamp, rec.value, 0 });
    ++result.stepsWritten;
  }
  for (const auto& rec : history.heartRate) {
    if (rec.value == 0)
      continue;
    batch.push_back(Sample{ id, Metric::HeartRate, rec.timestamp, rec.value, 0 });
    ++result.heartRateWritten;
  }

  store_.appendBatch(std::move(batch));
  fsm.contactSucceeded(clock_.now());

  spdlog::info("[Sync] ring {}: {} step and {} heart-rate sample(s) written", id,
               result.stepsWritten, result.heartRateWritten);
  result.status = CommandResult::success("synced " +
                                         std::to_string(result.stepsWritten +
                                                        result.heartRateWritten) +
                                         " samples");
  result.status.ringId = id;
  return result;
}
