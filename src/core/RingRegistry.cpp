/* @file RingRegistry.cpp
 * @brief ring table with synchronous JSON persistence
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <utility>

// Third-party headers
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// Zeddring headers
#include "core/RingRegistry.hpp"
#include "core/TimeSource.hpp"

using namespace zeddring::core;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

  json optionalTime(const std::optional<Timestamp>& t) {
    return t ? json(toEpochMillis(*t)) : json(nullptr);
  }

  std::optional<Timestamp> readTime(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null())
      return std::nullopt;
    return fromEpochMillis(j.at(key).get<std::int64_t>());
  }

  json optionalValue(const std::optional<std::int64_t>& v) { return v ? json(*v) : json(nullptr); }

  std::optional<std::int64_t> readValue(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null())
      return std::nullopt;
    return j.at(key).get<std::int64_t>();
  }

} // namespace

RingRegistry::RingRegistry(std::string storePath, std::string defaultName)
    : path_(std::move(storePath)), defaultName_(std::move(defaultName)) {}

std::optional<std::string> RingRegistry::normaliseAddress(const std::string& address) {
  if (address.size() != 17)
    return std::nullopt;

  std::string out = address;
  for (std::size_t i = 0; i < out.size(); ++i) {
    const bool separator = (i % 3) == 2;
    if (separator) {
      if (out[i] != ':' && out[i] != '-')
        return std::nullopt;
      out[i] = ':';
    } else {
      if (!std::isxdigit(static_cast<unsigned char>(out[i])))
        return std::nullopt;
      out[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[i])));
    }
  }
  return out;
}

void RingRegistry::load() {
  if (path_.empty() || !fs::exists(path_))
    return;

  std::ifstream in(path_);
  if (!in)
    throw StorageError("[Registry] cannot open " + path_);

  json doc;
  try {
    in >> doc;
  } catch (const json::exception& ex) {
    throw StorageError("[Registry] corrupt registry file " + path_ + ": " + ex.what());
  }

  std::unique_lock lock(mtx_);
  rings_.clear();
  try {
    nextId_ = doc.value("nextId", RingId{ 1 });
    for (const auto& r : doc.at("rings")) {
      Ring ring;
      ring.id = r.at("id").get<RingId>();
      ring.address = r.at("address").get<std::string>();
      ring.name = r.value("name", defaultName_);
      ring.status.lastSuccess = readTime(r, "lastSuccess");
      ring.status.lastAttempt = readTime(r, "lastAttempt");
      ring.readings.battery = readValue(r, "battery");
      ring.readings.heartRate = readValue(r, "heartRate");
      ring.readings.steps = readValue(r, "steps");
      nextId_ = std::max(nextId_, ring.id + 1);
      rings_.push_back(std::move(ring));
    }
  } catch (const json::exception& ex) {
    throw StorageError("[Registry] malformed registry file " + path_ + ": " + ex.what());
  }
  dirty_ = false;
  spdlog::info("[Registry] loaded {} ring(s) from {}", rings_.size(), path_);
}

void RingRegistry::flush() {
  std::unique_lock lock(mtx_);
  if (dirty_)
    persistLocked();
}

RingId RingRegistry::registerRing(const std::string& address,
                                  const std::optional<std::string>& name) {
  auto normalised = normaliseAddress(address);
  if (!normalised)
    throw RingError(ErrorKind::InvalidArgument, "[Registry] malformed address: " + address);

  // a record pending deletion still owns the address until it is purged:
  // its session may be mid-call on the same physical ring
  std::unique_lock lock(mtx_);
  const auto clash = std::find_if(rings_.begin(), rings_.end(),
                                  [&](const Ring& r) { return r.address == *normalised; });
  if (clash != rings_.end())
    throw RingError(ErrorKind::DuplicateAddress,
                    "[Registry] address already registered: " + *normalised);

  Ring ring;
  ring.id = nextId_++;
  ring.address = *normalised;
  ring.name = (name && !name->empty()) ? *name : defaultName_;
  rings_.push_back(ring);

  try {
    persistLocked();
  } catch (const StorageError&) {
    rings_.pop_back();
    --nextId_;
    throw;
  }
  spdlog::info("[Registry] registered ring {} '{}' ({})", ring.id, ring.name, ring.address);
  return ring.id;
}

void RingRegistry::rename(RingId id, const std::string& name) {
  if (name.empty())
    throw RingError(ErrorKind::InvalidArgument, "[Registry] empty ring name");

  std::unique_lock lock(mtx_);
  Ring* ring = findLocked(id);
  if (!ring || ring->pendingDeletion)
    throw RingError(ErrorKind::NotFound, "[Registry] unknown ring " + std::to_string(id));

  std::string previous = std::exchange(ring->name, name);
  try {
    persistLocked();
  } catch (const StorageError&) {
    ring->name = std::move(previous);
    throw;
  }
  spdlog::info("[Registry] renamed ring {} to '{}'", id, name);
}

void RingRegistry::remove(RingId id) {
  std::unique_lock lock(mtx_);
  Ring* ring = findLocked(id);
  if (!ring || ring->pendingDeletion)
    throw RingError(ErrorKind::NotFound, "[Registry] unknown ring " + std::to_string(id));

  ring->pendingDeletion = true;
  try {
    persistLocked();
  } catch (const StorageError&) {
    ring->pendingDeletion = false;
    throw;
  }
  spdlog::info("[Registry] ring {} marked for removal", id);
}

bool RingRegistry::purge(RingId id) {
  std::unique_lock lock(mtx_);
  const auto it =
      std::find_if(rings_.begin(), rings_.end(), [id](const Ring& r) { return r.id == id; });
  if (it == rings_.end())
    return false;
  rings_.erase(it);
  spdlog::info("[Registry] ring {} purged", id);
  return true;
}

std::optional<Ring> RingRegistry::get(RingId id) const {
  std::shared_lock lock(mtx_);
  const Ring* ring = findLocked(id);
  if (!ring)
    return std::nullopt;
  return *ring;
}

std::optional<Ring> RingRegistry::findByAddress(const std::string& address) const {
  auto normalised = normaliseAddress(address);
  if (!normalised)
    return std::nullopt;

  std::shared_lock lock(mtx_);
  for (const auto& r : rings_) {
    if (r.address == *normalised && !r.pendingDeletion)
      return r;
  }
  return std::nullopt;
}

std::vector<Ring> RingRegistry::list() const {
  std::shared_lock lock(mtx_);
  std::vector<Ring> out;
  out.reserve(rings_.size());
  std::copy_if(rings_.begin(), rings_.end(), std::back_inserter(out),
               [](const Ring& r) { return !r.pendingDeletion; });
  return out;
}

bool RingRegistry::updateStatus(RingId id, const RingStatus& status) {
  std::unique_lock lock(mtx_);
  Ring* ring = findLocked(id);
  if (!ring)
    return false;
  ring->status = status;
  dirty_ = true;
  return true;
}

bool RingRegistry::recordReading(RingId id, Metric metric, std::int64_t value) {
  std::unique_lock lock(mtx_);
  Ring* ring = findLocked(id);
  if (!ring)
    return false;

  switch (metric) {
  case Metric::Battery:
    ring->readings.battery = value;
    break;
  case Metric::HeartRate:
    ring->readings.heartRate = value;
    break;
  case Metric::Steps:
    ring->readings.steps = value;
    break;
  default:
    return false;
  }
  dirty_ = true;
  return true;
}

Ring* RingRegistry::findLocked(RingId id) {
  auto it = std::find_if(rings_.begin(), rings_.end(), [id](const Ring& r) { return r.id == id; });
  return it == rings_.end() ? nullptr : &*it;
}

const Ring* RingRegistry::findLocked(RingId id) const {
  auto it = std::find_if(rings_.begin(), rings_.end(), [id](const Ring& r) { return r.id == id; });
  return it == rings_.end() ? nullptr : &*it;
}

void RingRegistry::persistLocked() {
  if (path_.empty()) {
    dirty_ = false;
    return;
  }

  json doc;
  doc["nextId"] = nextId_;
  doc["rings"] = json::array();
  for (const auto& r : rings_) {
    if (r.pendingDeletion)
      continue;
    doc["rings"].push_back({ { "id", r.id },
                             { "address", r.address },
                             { "name", r.name },
                             { "lastSuccess", optionalTime(r.status.lastSuccess) },
                             { "lastAttempt", optionalTime(r.status.lastAttempt) },
                             { "battery", optionalValue(r.readings.battery) },
                             { "heartRate", optionalValue(r.readings.heartRate) },
                             { "steps", optionalValue(r.readings.steps) } });
  }

  const fs::path target(path_);
  const fs::path tmp = target.string() + ".tmp";
  std::error_code ec;
  if (target.has_parent_path())
    fs::create_directories(target.parent_path(), ec);

  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out)
      throw StorageError("[Registry] cannot write " + tmp.string());
    out << doc.dump(2);
    out.flush();
    if (!out)
      throw StorageError("[Registry] short write to " + tmp.string());
  }

  fs::rename(tmp, target, ec);
  if (ec)
    throw StorageError("[Registry] cannot replace " + path_ + ": " + ec.message());
  dirty_ = false;
}
