#pragma once
/** @file  DeviceDriver.hpp
 *  @brief Abstract capability interface every ring transport must implement.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// Zeddring headers
#include "core/Types.hpp"

namespace zeddring::drivers {

  struct HistoryRecord {
    core::Timestamp timestamp{};
    std::int64_t value{ 0 };
  };

  struct RingHistory {
    std::vector<HistoryRecord> steps{};
    std::vector<HistoryRecord> heartRate{};
  };

  struct DiscoveredRing {
    std::string address{};
    std::string name{};
    int rssi{ 0 };
  };

  /**
 * @class DeviceDriver
 * @brief Fixed, statically typed set of operations against one physical address.
 *
 *  * Every call gets the time budget it must honour; a call that cannot
 *    complete in time throws core::TransportError(TransportTimeout).
 *  * Transport or protocol failures throw core::TransportError(TransportFailure)
 *    or return false where the signature is boolean.
 *  * Implementations must be safe to call from several worker threads; the
 *    caller guarantees at most one call per address at a time.
 */
  class DeviceDriver {
  public:
    virtual ~DeviceDriver() = default;

    virtual bool connect(const std::string& address, std::chrono::milliseconds timeout) = 0;
    virtual bool disconnect(const std::string& address, std::chrono::milliseconds timeout) = 0;
    virtual int readBattery(const std::string& address, std::chrono::milliseconds timeout) = 0;
    virtual int readSteps(const std::string& address, std::chrono::milliseconds timeout) = 0;
    virtual int readHeartRate(const std::string& address, std::chrono::milliseconds timeout) = 0;
    virtual RingHistory readHistory(const std::string& address,
                                    std::chrono::milliseconds timeout) = 0;
    virtual bool setTime(const std::string& address, core::Timestamp when,
                         std::chrono::milliseconds timeout) = 0;
    virtual bool reboot(const std::string& address, std::chrono::milliseconds timeout) = 0;
    virtual std::vector<DiscoveredRing> scan(std::chrono::milliseconds timeout) = 0;
  };

} // namespace zeddring::drivers
