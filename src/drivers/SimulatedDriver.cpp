/* @file SimulatedDriver.cpp
 * @brief random-walk telemetry for simulated rings
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// Third-party headers
#include <spdlog/spdlog.h>

// Zeddring headers
#include "core/Errors.hpp"
#include "drivers/SimulatedDriver.hpp"

using namespace zeddring::drivers;
using zeddring::core::ErrorKind;
using zeddring::core::TransportError;

SimulatedDriver::SimulatedDriver(std::vector<DiscoveredRing> advertised, std::uint32_t seed,
                                 double failureRate)
    : advertised_(std::move(advertised)), failureRate_(failureRate), rng_(seed) {}

void SimulatedDriver::maybeFail(const char* op, const std::string& address) {
  if (failureRate_ <= 0.0)
    return;
  std::bernoulli_distribution fail(std::min(failureRate_, 1.0));
  if (fail(rng_))
    throw TransportError(ErrorKind::TransportFailure,
                         std::string("[Sim] ") + op + " " + address + ": simulated radio dropout");
}

SimulatedDriver::SimRing& SimulatedDriver::connectedRing(const std::string& address,
                                                         const char* op) {
  auto it = rings_.find(address);
  if (it == rings_.end() || !it->second.connected)
    throw TransportError(ErrorKind::TransportFailure,
                         std::string("[Sim] ") + op + " " + address + ": not connected");
  maybeFail(op, address);
  return it->second;
}

bool SimulatedDriver::connect(const std::string& address, std::chrono::milliseconds) {
  std::lock_guard<std::mutex> lock(mtx_);
  maybeFail("connect", address);
  auto& ring = rings_[address];
  ring.connected = true;
  spdlog::debug("[Sim] {} connected", address);
  return true;
}

bool SimulatedDriver::disconnect(const std::string& address, std::chrono::milliseconds) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = rings_.find(address);
  if (it != rings_.end())
    it->second.connected = false;
  return true;
}

int SimulatedDriver::readBattery(const std::string& address, std::chrono::milliseconds) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto& ring = connectedRing(address, "readBattery");
  std::uniform_real_distribution<double> drain(0.0, 0.5);
  ring.battery = std::max(5.0, ring.battery - drain(rng_));
  return static_cast<int>(ring.battery);
}

int SimulatedDriver::readSteps(const std::string& address, std::chrono::milliseconds) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto& ring = connectedRing(address, "readSteps");
  std::uniform_int_distribution<int> walked(0, 120);
  ring.steps += walked(rng_);
  return ring.steps;
}

int SimulatedDriver::readHeartRate(const std::string& address, std::chrono::milliseconds) {
  std::lock_guard<std::mutex> lock(mtx_);
  connectedRing(address, "readHeartRate");
  std::uniform_int_distribution<int> bpm(55, 95);
  return bpm(rng_);
}

RingHistory SimulatedDriver::readHistory(const std::string& address, std::chrono::milliseconds) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto& ring = connectedRing(address, "readHistory");

  // last 24 h: steps per hour, heart rate every 30 min
  RingHistory history;
  const auto now = std::chrono::time_point_cast<std::chrono::minutes>(
                       std::chrono::system_clock::now() + ring.clockSkew);
  std::uniform_int_distribution<int> hourly(0, 900);
  std::uniform_int_distribution<int> bpm(50, 110);
  for (int h = 24; h > 0; --h)
    history.steps.push_back({ now - std::chrono::hours(h), hourly(rng_) });
  for (int slot = 48; slot > 0; --slot)
    history.heartRate.push_back({ now - std::chrono::minutes(30 * slot), bpm(rng_) });
  return history;
}

bool SimulatedDriver::setTime(const std::string& address, core::Timestamp when,
                              std::chrono::milliseconds) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto& ring = connectedRing(address, "setTime");
  ring.clockSkew = when - std::chrono::system_clock::now();
  return true;
}

bool SimulatedDriver::reboot(const std::string& address, std::chrono::milliseconds) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto& ring = connectedRing(address, "reboot");
  ring.connected = false;
  ring.clockSkew = {};
  return true;
}

std::vector<DiscoveredRing> SimulatedDriver::scan(std::chrono::milliseconds) {
  std::lock_guard<std::mutex> lock(mtx_);
  return advertised_;
}

bool SimulatedDriver::isConnected(const std::string& address) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = rings_.find(address);
  return it != rings_.end() && it->second.connected;
}
