#pragma once
/** @file  GuardedDriver.hpp
 *  @brief Timeout + validation boundary in front of any DeviceDriver.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Zeddring headers
#include "core/Errors.hpp"
#include "drivers/DeviceDriver.hpp"

namespace zeddring::drivers {

  /**
 * @class GuardedDriver
 * @brief The only way core code talks to a DeviceDriver.
 *
 *  * Every call runs on a watchdog thread. The caller waits at most the
 *    configured budget (plus a short grace) and then gets TransportTimeout,
 *    whether or not the driver honours the budget it was handed.
 *  * A call abandoned at its deadline keeps running in the background. Until
 *    it returns, further calls against the same address fail fast with
 *    TransportTimeout, so one address never sees two overlapping calls.
 *  * `false` results and out-of-range readings become TransportFailure.
 *  * Any other exception leaking from a driver is wrapped as TransportFailure,
 *    so callers only ever catch core::TransportError.
 *
 *  Destruction waits for abandoned calls to come back.
 */
  class GuardedDriver {
  public:
    GuardedDriver(DeviceDriver& driver, std::chrono::milliseconds operationTimeout);
    ~GuardedDriver();

    GuardedDriver(const GuardedDriver&) = delete;
    GuardedDriver& operator=(const GuardedDriver&) = delete;

    void connect(const std::string& address);
    void disconnect(const std::string& address);
    int readBattery(const std::string& address);
    int readSteps(const std::string& address);
    int readHeartRate(const std::string& address);
    RingHistory readHistory(const std::string& address);
    void setTime(const std::string& address, core::Timestamp when);
    void reboot(const std::string& address);
    std::vector<DiscoveredRing> scan(std::chrono::milliseconds timeout);

    std::chrono::milliseconds timeout() const { return timeout_; }

    /// Calls abandoned at their deadline that have not returned yet.
    std::size_t outstandingCalls();

    /// Extra wait past the budget before a call is abandoned.
    static constexpr std::chrono::milliseconds kGrace{ 100 };

  private:
    struct Straggler {
      std::string address;
      std::thread worker;
      std::shared_ptr<std::atomic<bool>> done;
    };

    template <typename Fn>
    auto invoke(const char* op, const std::string& address, std::chrono::milliseconds budget,
                Fn fn);
    void require(bool accepted, const char* op, const std::string& address);
    int checkRange(int value, int lo, int hi, const char* op, const std::string& address);
    bool stillRunning(const std::string& address);
    void reapLocked();

    DeviceDriver& driver_;
    std::chrono::milliseconds timeout_;
    std::mutex mtx_;
    std::vector<Straggler> outstanding_;
  };

} // namespace zeddring::drivers
