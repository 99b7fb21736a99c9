#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON file + ZEDDRING_* environment).
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/Types.hpp"

namespace zeddring::core {

  /**
 * @struct AppConfig
 * @brief Every recognised option with its default.
 */
  struct AppConfig {
    std::chrono::seconds scanInterval{ 60 };
    std::chrono::seconds scanTimeout{ 10 };
    std::chrono::seconds operationTimeout{ 10 };
    unsigned maxRetryAttempts{ 3 };
    std::chrono::seconds retryDelay{ 300 };
    std::chrono::seconds extendedRetryDelay{ 1800 };
    bool persistentConnection{ true };
    bool autoDiscover{ false };
    std::string discoverPrefix{ "R02" };
    bool syncTimeOnConnect{ true };
    unsigned workerThreads{ 4 };
    std::string dataDir{ "./data" };
    std::string driver{ "simulated" };
    std::string bridgeDevice{ "/dev/ttyACM0" };
    std::string defaultRingName{ "Colmi R02" };
    std::string logLevel{ "info" };

    RetryPolicy retryPolicy() const {
      return RetryPolicy{ retryDelay, extendedRetryDelay, maxRetryAttempts };
    }
    std::string registryPath() const { return dataDir + "/rings.json"; }
    std::string telemetryPath() const { return dataDir + "/telemetry.csv"; }

    /// Throws `std::runtime_error` naming the first invalid option.
    void validate() const;
  };

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file, overlays the environment and
 *        hands back a validated AppConfig.
 *
 *  * No caching: every call to `load()` re-reads the file (cheap, tiny file).
 *  * A missing file is not an error: defaults + environment apply.
 */
  class ConfigLoader {
  public:
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /// @param configPath  Absolute or relative path; empty means "no file".
    explicit ConfigLoader(std::string configPath, EnvLookup env = systemEnvironment);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// load() + fromJson() + applyEnvironment() + validate().
    AppConfig loadConfig() const;

    /// Unknown keys are ignored; wrong types throw `std::runtime_error`.
    static AppConfig fromJson(const nlohmann::json& doc);

    void applyEnvironment(AppConfig& cfg) const;

    static std::optional<std::string> systemEnvironment(const std::string& name);

  private:
    std::string path_;
    EnvLookup env_;
  };

} // namespace zeddring::core
