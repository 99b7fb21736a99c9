/* @file RingOperations.cpp
 * @brief the driver call sequences behind scheduler jobs and API commands
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <array>
#include <functional>

// Third-party headers
#include <spdlog/spdlog.h>

// Zeddring headers
#include "core/ErrorMonitor.hpp"
#include "core/OperationLocks.hpp"
#include "core/RingOperations.hpp"
#include "core/RingRegistry.hpp"
#include "core/TelemetryStore.hpp"
#include "core/TimeSource.hpp"
#include "drivers/GuardedDriver.hpp"

using namespace zeddring::core;

RingOperations::RingOperations(drivers::GuardedDriver& driver, RingRegistry& registry,
                               TelemetryStore& store, ErrorMonitor& errors,
                               const TimeSource& clock, bool syncTimeOnConnect)
    : driver_(driver), registry_(registry), store_(store), errors_(errors), clock_(clock),
      syncTimeOnConnect_(syncTimeOnConnect) {}

std::string RingOperations::attentionMessage(RingId id) {
  return "ring " + std::to_string(id) + " reached its retry limit";
}

ErrorKind RingOperations::connect(RingSession& session) {
  auto& fsm = session.fsm();
  fsm.beginConnect(clock_.now());

  try {
    driver_.connect(session.address());
  } catch (const TransportError& ex) {
    fsm.connectFailed(clock_.now(), ex.kind(), ex.what());
    if (fsm.limitReached())
      errors_.notifyFailure(attentionMessage(session.id()));
    return ex.kind();
  }

  // removal while the connect was in flight: keep the link state truthful,
  // the release path drops it and purges the ring
  fsm.connectSucceeded(clock_.now());
  errors_.clearFailure(attentionMessage(session.id()));
  spdlog::info("[Ops] ring {} ({}) connected", session.id(), session.address());
  if (session.cancelled())
    return ErrorKind::Cancelled;

  if (syncTimeOnConnect_)
    return setTime(session);
  return ErrorKind::None;
}

ErrorKind RingOperations::poll(RingSession& session) {
  struct Step {
    Metric metric;
    std::function<int(drivers::GuardedDriver&, const std::string&)> read;
  };
  // battery first: cheapest read and the one the dashboard acts on
  static const std::array<Step, 3> steps{ {
      { Metric::Battery, [](auto& d, const auto& a) { return d.readBattery(a); } },
      { Metric::Steps, [](auto& d, const auto& a) { return d.readSteps(a); } },
      { Metric::HeartRate, [](auto& d, const auto& a) { return d.readHeartRate(a); } },
  } };

  auto& fsm = session.fsm();
  fsm.contactAttempted(clock_.now());

  for (const auto& step : steps) {
    if (session.cancelled())
      return ErrorKind::Cancelled;
    if (session.disconnectPending())
      return ErrorKind::None; // release path disconnects

    int value = 0;
    try {
      value = step.read(driver_, session.address());
    } catch (const TransportError& ex) {
      return linkFailure(session, ex);
    }

    const auto at = clock_.now();
    if (step.metric == Metric::HeartRate && value == 0) {
      spdlog::debug("[Ops] ring {} reports heart rate 0 (not worn), skipped", session.id());
    } else {
      store_.append(Sample{ session.id(), step.metric, at, value, 0 });
      registry_.recordReading(session.id(), step.metric, value);
    }
    fsm.contactSucceeded(at);
  }
  return ErrorKind::None;
}

ErrorKind RingOperations::setTime(RingSession& session) {
  if (session.fsm().state() != ConnectionState::Connected)
    return ErrorKind::DeviceUnavailable;

  const auto now = clock_.now();
  try {
    driver_.setTime(session.address(), now);
  } catch (const TransportError& ex) {
    return linkFailure(session, ex);
  }
  session.fsm().contactSucceeded(clock_.now());
  spdlog::debug("[Ops] ring {} clock set to {}", session.id(), toIso8601(now));
  return ErrorKind::None;
}

ErrorKind RingOperations::reboot(RingSession& session) {
  if (session.fsm().state() != ConnectionState::Connected)
    return ErrorKind::DeviceUnavailable;

  try {
    driver_.reboot(session.address());
  } catch (const TransportError& ex) {
    return linkFailure(session, ex);
  }
  session.fsm().contactSucceeded(clock_.now());
  spdlog::info("[Ops] ring {} rebooting", session.id());
  disconnect(session, "rebooted");
  return ErrorKind::None;
}

void RingOperations::disconnect(RingSession& session, const std::string& reason) {
  auto& fsm = session.fsm();
  if (fsm.state() == ConnectionState::Connected) {
    try {
      driver_.disconnect(session.address());
    } catch (const TransportError& ex) {
      // the link is going away either way
      spdlog::warn("[Ops] ring {} disconnect: {}", session.id(), ex.what());
    }
  }
  fsm.forceDisconnect(reason);
  spdlog::info("[Ops] ring {} disconnected ({})", session.id(), reason);
}

std::size_t RingOperations::discover(std::chrono::seconds scanTimeout, const std::string& prefix) {
  std::vector<drivers::DiscoveredRing> found;
  try {
    found = driver_.scan(scanTimeout);
  } catch (const TransportError& ex) {
    spdlog::warn("[Ops] scan failed: {}", ex.what());
    return 0;
  }

  std::size_t added = 0;
  for (const auto& dev : found) {
    if (dev.name.rfind(prefix, 0) != 0 || registry_.findByAddress(dev.address))
      continue;
    try {
      registry_.registerRing(dev.address, dev.name);
      ++added;
    } catch (const RingError& ex) {
      spdlog::warn("[Ops] discovered {} not registered: {}", dev.address, ex.what());
    }
  }
  if (added > 0)
    spdlog::info("[Ops] discovery registered {} new ring(s)", added);
  return added;
}

ErrorKind RingOperations::linkFailure(RingSession& session, const TransportError& ex) {
  session.fsm().linkLost(clock_.now(), ex.what());
  return ex.kind();
}
