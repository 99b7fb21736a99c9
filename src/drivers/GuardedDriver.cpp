/* @file GuardedDriver.cpp
 * @brief converts every driver outcome into a value or a core::TransportError
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <future>
#include <limits>
#include <string>

// Third-party headers
#include <spdlog/spdlog.h>

// Zeddring headers
#include "drivers/GuardedDriver.hpp"

using namespace zeddring::drivers;
using zeddring::core::ErrorKind;
using zeddring::core::TransportError;

GuardedDriver::GuardedDriver(DeviceDriver& driver, std::chrono::milliseconds operationTimeout)
    : driver_(driver), timeout_(operationTimeout) {}

GuardedDriver::~GuardedDriver() {
  std::lock_guard<std::mutex> lock(mtx_);
  for (auto& s : outstanding_) {
    spdlog::debug("[Guard] waiting for abandoned call on {}", s.address);
    s.worker.join();
  }
}

std::size_t GuardedDriver::outstandingCalls() {
  std::lock_guard<std::mutex> lock(mtx_);
  reapLocked();
  return outstanding_.size();
}

void GuardedDriver::reapLocked() {
  auto finished = std::stable_partition(outstanding_.begin(), outstanding_.end(),
                                        [](const Straggler& s) { return !s.done->load(); });
  for (auto it = finished; it != outstanding_.end(); ++it)
    it->worker.join();
  outstanding_.erase(finished, outstanding_.end());
}

bool GuardedDriver::stillRunning(const std::string& address) {
  std::lock_guard<std::mutex> lock(mtx_);
  reapLocked();
  return std::any_of(outstanding_.begin(), outstanding_.end(),
                     [&](const Straggler& s) { return s.address == address; });
}

template <typename Fn>
auto GuardedDriver::invoke(const char* op, const std::string& address,
                           std::chrono::milliseconds budget, Fn fn) {
  using Result = decltype(fn(budget));

  if (stillRunning(address))
    throw TransportError(ErrorKind::TransportTimeout,
                         std::string(op) + " " + address + ": previous call still outstanding");

  const auto started = std::chrono::steady_clock::now();
  auto overran = [&] { return std::chrono::steady_clock::now() - started > budget; };

  // fn owns copies of everything it touches: it may outlive this frame
  std::packaged_task<Result()> task([fn = std::move(fn), budget]() mutable { return fn(budget); });
  auto result = task.get_future();
  auto done = std::make_shared<std::atomic<bool>>(false);
  std::thread worker([task = std::move(task), done]() mutable {
    task();
    done->store(true);
  });

  if (result.wait_for(budget + kGrace) != std::future_status::ready) {
    spdlog::warn("[Guard] {} {} still running after {} ms, abandoned", op, address,
                 budget.count());
    {
      std::lock_guard<std::mutex> lock(mtx_);
      outstanding_.push_back(Straggler{ address, std::move(worker), std::move(done) });
    }
    throw TransportError(ErrorKind::TransportTimeout, std::string(op) + " " + address +
                                                          " exceeded " +
                                                          std::to_string(budget.count()) + " ms");
  }
  worker.join();

  try {
    auto value = result.get();
    if (overran())
      throw TransportError(ErrorKind::TransportTimeout,
                           std::string(op) + " " + address + " exceeded " +
                               std::to_string(budget.count()) + " ms");
    return value;
  } catch (const TransportError&) {
    throw;
  } catch (const std::exception& ex) {
    throw TransportError(overran() ? ErrorKind::TransportTimeout : ErrorKind::TransportFailure,
                         std::string(op) + " " + address + ": " + ex.what());
  }
}

void GuardedDriver::require(bool accepted, const char* op, const std::string& address) {
  if (!accepted)
    throw TransportError(ErrorKind::TransportFailure,
                         std::string(op) + " " + address + " rejected by device");
}

int GuardedDriver::checkRange(int value, int lo, int hi, const char* op,
                              const std::string& address) {
  if (value < lo || value > hi)
    throw TransportError(ErrorKind::TransportFailure, std::string(op) + " " + address +
                                                          " returned out-of-range value " +
                                                          std::to_string(value));
  return value;
}

void GuardedDriver::connect(const std::string& address) {
  require(invoke("connect", address, timeout_,
                 [this, address](auto budget) { return driver_.connect(address, budget); }),
          "connect", address);
}

void GuardedDriver::disconnect(const std::string& address) {
  require(invoke("disconnect", address, timeout_,
                 [this, address](auto budget) { return driver_.disconnect(address, budget); }),
          "disconnect", address);
}

int GuardedDriver::readBattery(const std::string& address) {
  return checkRange(
      invoke("readBattery", address, timeout_,
             [this, address](auto budget) { return driver_.readBattery(address, budget); }),
      0, 100, "readBattery", address);
}

int GuardedDriver::readSteps(const std::string& address) {
  return checkRange(
      invoke("readSteps", address, timeout_,
             [this, address](auto budget) { return driver_.readSteps(address, budget); }),
      0, std::numeric_limits<int>::max(), "readSteps", address);
}

int GuardedDriver::readHeartRate(const std::string& address) {
  return checkRange(
      invoke("readHeartRate", address, timeout_,
             [this, address](auto budget) { return driver_.readHeartRate(address, budget); }),
      0, std::numeric_limits<int>::max(), "readHeartRate", address);
}

RingHistory GuardedDriver::readHistory(const std::string& address) {
  return invoke("readHistory", address, timeout_,
                [this, address](auto budget) { return driver_.readHistory(address, budget); });
}

void GuardedDriver::setTime(const std::string& address, core::Timestamp when) {
  require(invoke("setTime", address, timeout_,
                 [this, address, when](auto budget) {
                   return driver_.setTime(address, when, budget);
                 }),
          "setTime", address);
}

void GuardedDriver::reboot(const std::string& address) {
  require(invoke("reboot", address, timeout_,
                 [this, address](auto budget) { return driver_.reboot(address, budget); }),
          "reboot", address);
}

std::vector<DiscoveredRing> GuardedDriver::scan(std::chrono::milliseconds timeout) {
  return invoke("scan", "*", timeout, [this](auto budget) { return driver_.scan(budget); });
}
