#pragma once
/** @file  SimulatedDriver.hpp
 *  @brief In-process ring fleet used when no bridge dongle is attached.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

// Zeddring headers
#include "drivers/DeviceDriver.hpp"

namespace zeddring::drivers {

  /**
 * @class SimulatedDriver
 * @brief Plausible readings for any address; `scan()` advertises a fixed list.
 *
 *  * Reads on a ring that is not connected fail like a dropped link would.
 *  * \p failureRate injects random TransportFailures (0 disables).
 *  * Battery drains and steps only grow, so dashboards look alive.
 */
  class SimulatedDriver final : public DeviceDriver {
  public:
    static DiscoveredRing defaultRing() { return { "87:89:99:BC:B4:D5", "R02_B4D5", -60 }; }

    explicit SimulatedDriver(std::vector<DiscoveredRing> advertised = { defaultRing() },
                             std::uint32_t seed = std::random_device{}(),
                             double failureRate = 0.0);

    bool connect(const std::string& address, std::chrono::milliseconds timeout) override;
    bool disconnect(const std::string& address, std::chrono::milliseconds timeout) override;
    int readBattery(const std::string& address, std::chrono::milliseconds timeout) override;
    int readSteps(const std::string& address, std::chrono::milliseconds timeout) override;
    int readHeartRate(const std::string& address, std::chrono::milliseconds timeout) override;
    RingHistory readHistory(const std::string& address, std::chrono::milliseconds timeout) override;
    bool setTime(const std::string& address, core::Timestamp when,
                 std::chrono::milliseconds timeout) override;
    bool reboot(const std::string& address, std::chrono::milliseconds timeout) override;
    std::vector<DiscoveredRing> scan(std::chrono::milliseconds timeout) override;

    bool isConnected(const std::string& address) const;

  private:
    struct SimRing {
      bool connected{ false };
      double battery{ 100.0 };
      int steps{ 0 };
      std::chrono::system_clock::duration clockSkew{};
    };

    SimRing& connectedRing(const std::string& address, const char* op); ///< caller holds mtx_
    void maybeFail(const char* op, const std::string& address);        ///< caller holds mtx_

    std::vector<DiscoveredRing> advertised_;
    double failureRate_;
    mutable std::mutex mtx_;
    std::mt19937 rng_;
    std::unordered_map<std::string, SimRing> rings_{};
  };

} // namespace zeddring::drivers
