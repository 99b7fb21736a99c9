#pragma once
/** @file  DriverFactory.hpp
 *  @brief Runtime registry that maps driver names to creators.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include "drivers/DeviceDriver.hpp"

namespace zeddring::core {
  struct AppConfig;
}

namespace zeddring::drivers {

  /**
 * @class DriverFactory
 * @brief Register & instantiate device drivers by string key.
 *
 *  * Keeps SystemCoordinator decoupled from concrete transports.
 *  * Creators are lambdas returning `unique_ptr<DeviceDriver>`.
 */
  class DriverFactory {
  public:
    using Creator = std::function<std::unique_ptr<DeviceDriver>(const core::AppConfig&)>;

    /// Factory preloaded with "simulated" and "bridge".
    static DriverFactory withBuiltins();

    /// Register a driver under \p name.  Returns false on duplicate.
    bool registerDriver(const std::string& name, Creator maker);

    /// Create a fresh instance or throw `std::out_of_range` if unknown.
    std::unique_ptr<DeviceDriver> create(const std::string& name,
                                         const core::AppConfig& config) const;

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace zeddring::drivers
