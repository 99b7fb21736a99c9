#pragma once
/** @file  BridgeDriver.hpp
 *  @brief DeviceDriver speaking the bridge dongle's line protocol over a SerialChannel.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Zeddring headers
#include "drivers/DeviceDriver.hpp"
#include "io/SerialChannel.hpp"
#include "protocols/BridgeCommand.hpp"
#include "protocols/BridgeResponse.hpp"

namespace zeddring::drivers {

  /**
 * @class BridgeDriver
 * @brief One request line per operation, one tagged reply (plus records).
 *
 *  * The dongle owns the radio and the BLE codec; we only frame commands.
 *  * Calls are serialized on the single channel: different rings queue here
 *    for the duration of one round trip.
 *  * A reply carrying a stale tag belongs to a request that already timed
 *    out and is dropped.
 */
  class BridgeDriver final : public DeviceDriver {
  public:
    static constexpr speed_t kDefaultBaud = B115200;

    BridgeDriver(std::unique_ptr<io::SerialChannel> channel, std::string device,
                 speed_t baud = kDefaultBaud);

    /// Open the device. Throws `std::runtime_error` if it cannot be opened.
    void start();

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

  private:
    struct Reply {
      std::string payload{};
      std::vector<protocols::BridgeResponse> records{};
    };

    /// Send and wait for the matching OK. ERR, silence and I/O errors throw
    /// core::TransportError. \p multiline: OK carries a record count.
    Reply transact(const std::string& verb, std::vector<std::string> args,
                   std::chrono::milliseconds timeout, bool multiline = false);
    int readInt(const std::string& verb, const std::string& address,
                std::chrono::milliseconds timeout);

    std::unique_ptr<io::SerialChannel> channel_;
    std::string device_;
    speed_t baud_;
    std::mutex mtx_;
    std::uint32_t nextTag_{ 0 };
  };

} // namespace zeddring::drivers
