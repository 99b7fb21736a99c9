/* @file ConfigLoader.cpp
 * @brief JSON config file + ZEDDRING_* environment overlay
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

// Third-party headers
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// Zeddring headers
#include "core/ConfigLoader.hpp"

using namespace zeddring::core;
using json = nlohmann::json;

namespace {

  template <typename T> void readKey(const json& doc, const char* key, T& out) {
    if (!doc.contains(key))
      return;
    try {
      out = doc.at(key).get<T>();
    } catch (const json::exception& ex) {
      throw std::runtime_error(std::string("[ConfigLoader] bad value for '") + key +
                               "': " + ex.what());
    }
  }

  void readSeconds(const json& doc, const char* key, std::chrono::seconds& out) {
    long long secs = out.count();
    readKey(doc, key, secs);
    out = std::chrono::seconds{ secs };
  }

  // read wide so that -1 is not wrapped into a huge unsigned
  void readCount(const json& doc, const char* key, unsigned& out) {
    long long n = out;
    readKey(doc, key, n);
    if (n < 0 || n > std::numeric_limits<unsigned>::max())
      throw std::runtime_error(std::string("[ConfigLoader] '") + key + "' out of range: " +
                               std::to_string(n));
    out = static_cast<unsigned>(n);
  }

  bool parseBool(const std::string& name, std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "true" || value == "1" || value == "yes" || value == "on")
      return true;
    if (value == "false" || value == "0" || value == "no" || value == "off")
      return false;
    throw std::runtime_error("[ConfigLoader] " + name + " is not a boolean: " + value);
  }

  long long parseInt(const std::string& name, const std::string& value) {
    try {
      std::size_t used = 0;
      const long long v = std::stoll(value, &used);
      if (used != value.size())
        throw std::invalid_argument(value);
      return v;
    } catch (const std::logic_error&) {
      throw std::runtime_error("[ConfigLoader] " + name + " is not an integer: " + value);
    }
  }

} // namespace

void AppConfig::validate() const {
  auto positive = [](std::chrono::seconds s, const char* key) {
    if (s.count() <= 0)
      throw std::runtime_error(std::string("[ConfigLoader] ") + key + " must be positive");
  };
  positive(scanInterval, "scanInterval");
  positive(scanTimeout, "scanTimeout");
  positive(operationTimeout, "operationTimeout");
  positive(retryDelay, "retryDelay");
  positive(extendedRetryDelay, "extendedRetryDelay");
  if (maxRetryAttempts < 1)
    throw std::runtime_error("[ConfigLoader] maxRetryAttempts must be at least 1");
  if (workerThreads < 1)
    throw std::runtime_error("[ConfigLoader] workerThreads must be at least 1");
  if (dataDir.empty())
    throw std::runtime_error("[ConfigLoader] dataDir must not be empty");
}

ConfigLoader::ConfigLoader(std::string configPath, EnvLookup env)
    : path_(std::move(configPath)), env_(std::move(env)) {}

json ConfigLoader::load() const {
  if (path_.empty() || !std::filesystem::exists(path_)) {
    if (!path_.empty())
      spdlog::info("[ConfigLoader] {} not found, using defaults", path_);
    return json::object();
  }

  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  try {
    json doc = json::parse(in);
    if (!doc.is_object())
      throw std::runtime_error("[ConfigLoader] " + path_ + " must contain a JSON object");
    return doc;
  } catch (const json::parse_error& ex) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + ex.what());
  }
}

AppConfig ConfigLoader::loadConfig() const {
  AppConfig cfg = fromJson(load());
  applyEnvironment(cfg);
  cfg.validate();
  return cfg;
}

AppConfig ConfigLoader::fromJson(const json& doc) {
  AppConfig cfg;
  readSeconds(doc, "scanInterval", cfg.scanInterval);
  readSeconds(doc, "scanTimeout", cfg.scanTimeout);
  readSeconds(doc, "operationTimeout", cfg.operationTimeout);
  readCount(doc, "maxRetryAttempts", cfg.maxRetryAttempts);
  readSeconds(doc, "retryDelay", cfg.retryDelay);
  readSeconds(doc, "extendedRetryDelay", cfg.extendedRetryDelay);
  readKey(doc, "persistentConnection", cfg.persistentConnection);
  readKey(doc, "autoDiscover", cfg.autoDiscover);
  readKey(doc, "discoverPrefix", cfg.discoverPrefix);
  readKey(doc, "syncTimeOnConnect", cfg.syncTimeOnConnect);
  readCount(doc, "workerThreads", cfg.workerThreads);
  readKey(doc, "dataDir", cfg.dataDir);
  readKey(doc, "driver", cfg.driver);
  readKey(doc, "bridgeDevice", cfg.bridgeDevice);
  readKey(doc, "defaultRingName", cfg.defaultRingName);
  readKey(doc, "logLevel", cfg.logLevel);
  return cfg;
}

void ConfigLoader::applyEnvironment(AppConfig& cfg) const {
  if (!env_)
    return;

  auto seconds = [&](const char* name, std::chrono::seconds& out) {
    if (auto v = env_(name))
      out = std::chrono::seconds{ parseInt(name, *v) };
  };
  auto count = [&](const char* name, unsigned& out) {
    if (auto v = env_(name)) {
      const long long n = parseInt(name, *v);
      if (n < 0)
        throw std::runtime_error(std::string("[ConfigLoader] ") + name + " must not be negative");
      out = static_cast<unsigned>(n);
    }
  };
  auto flag = [&](const char* name, bool& out) {
    if (auto v = env_(name))
      out = parseBool(name, *v);
  };
  auto text = [&](const char* name, std::string& out) {
    if (auto v = env_(name))
      out = *v;
  };

  seconds("ZEDDRING_SCAN_INTERVAL", cfg.scanInterval);
  seconds("ZEDDRING_SCAN_TIMEOUT", cfg.scanTimeout);
  seconds("ZEDDRING_OPERATION_TIMEOUT", cfg.operationTimeout);
  count("ZEDDRING_MAX_RETRY_ATTEMPTS", cfg.maxRetryAttempts);
  seconds("ZEDDRING_RETRY_DELAY", cfg.retryDelay);
  seconds("ZEDDRING_EXTENDED_RETRY_DELAY", cfg.extendedRetryDelay);
  flag("ZEDDRING_PERSISTENT_CONNECTION", cfg.persistentConnection);
  flag("ZEDDRING_AUTO_DISCOVER", cfg.autoDiscover);
  text("ZEDDRING_DISCOVER_PREFIX", cfg.discoverPrefix);
  flag("ZEDDRING_SYNC_TIME", cfg.syncTimeOnConnect);
  count("ZEDDRING_WORKER_THREADS", cfg.workerThreads);
  text("ZEDDRING_DATA_DIR", cfg.dataDir);
  text("ZEDDRING_DRIVER", cfg.driver);
  text("ZEDDRING_BRIDGE_DEVICE", cfg.bridgeDevice);
  text("ZEDDRING_DEFAULT_RING_NAME", cfg.defaultRingName);
  text("ZEDDRING_LOG_LEVEL", cfg.logLevel);
}

std::optional<std::string> ConfigLoader::systemEnvironment(const std::string& name) {
  if (const char* v = std::getenv(name.c_str()))
    return std::string(v);
  return std::nullopt;
}
