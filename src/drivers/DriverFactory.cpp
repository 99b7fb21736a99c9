/* @file DriverFactory.cpp
 * @brief name -> DeviceDriver creator table
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// Zeddring headers
#include "core/ConfigLoader.hpp"
#include "drivers/BridgeDriver.hpp"
#include "drivers/DriverFactory.hpp"
#include "drivers/SimulatedDriver.hpp"

using namespace zeddring::drivers;

DriverFactory DriverFactory::withBuiltins() {
  DriverFactory factory;
  factory.registerDriver("simulated", [](const core::AppConfig&) {
    return std::make_unique<SimulatedDriver>();
  });
  factory.registerDriver("bridge", [](const core::AppConfig& cfg) {
    auto driver = std::make_unique<BridgeDriver>(std::make_unique<io::SerialChannel>(),
                                                 cfg.bridgeDevice);
    driver->start();
    return driver;
  });
  return factory;
}

bool DriverFactory::registerDriver(const std::string& name, Creator maker) {
  return creators_.emplace(name, std::move(maker)).second;
}

std::unique_ptr<DeviceDriver> DriverFactory::create(const std::string& name,
                                                    const core::AppConfig& config) const {
  auto it = creators_.find(name);
  if (it == creators_.end())
    throw std::out_of_range("[DriverFactory] unknown driver '" + name + "'");
  return it->second(config);
}
