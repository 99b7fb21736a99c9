/* @file CommandDispatcher.cpp
 * @brief JSON control channel -> RingService
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <limits>
#include <optional>

// Third-party headers
#include <spdlog/spdlog.h>

// Zeddring headers
#include "api/CommandDispatcher.hpp"
#include "api/RingJson.hpp"
#include "api/RingService.hpp"
#include "core/TimeSource.hpp"

using namespace zeddring::api;
using namespace zeddring::core;
using json = nlohmann::json;

namespace {

  [[noreturn]] void badArgument(const std::string& what) {
    throw RingError(ErrorKind::InvalidArgument, what);
  }

  RingId requireId(const json& req) {
    if (!req.contains("id") || !req.at("id").is_number_unsigned())
      badArgument("'id' must be a positive integer");
    const auto id = req.at("id").get<std::uint64_t>();
    if (id == 0 || id > std::numeric_limits<RingId>::max())
      badArgument("'id' out of range");
    return static_cast<RingId>(id);
  }

  std::string requireString(const json& req, const char* key) {
    if (!req.contains(key) || !req.at(key).is_string())
      badArgument(std::string("'") + key + "' must be a string");
    return req.at(key).get<std::string>();
  }

  std::optional<std::string> optionalString(const json& req, const char* key) {
    if (!req.contains(key) || req.at(key).is_null())
      return std::nullopt;
    return requireString(req, key);
  }

  Metric requireMetric(const json& req) {
    const auto name = requireString(req, "metric");
    if (auto m = metricFromString(name))
      return *m;
    badArgument("unknown metric '" + name + "'");
  }

  Timestamp requireTime(const json& req, const char* key) {
    const auto text = requireString(req, key);
    if (auto t = parseIso8601(text))
      return *t;
    badArgument(std::string("'") + key + "' is not an ISO-8601 timestamp: " + text);
  }

  json failure(ErrorKind kind, const std::string& message) {
    return toJson(CommandResult::failure(kind, message));
  }

} // namespace

CommandDispatcher::CommandDispatcher(RingService& service) : service_(service) {
  registerBuiltins();
}

bool CommandDispatcher::registerHandler(const std::string& name, Handler handler) {
  return handlers_.emplace(name, std::move(handler)).second;
}

std::vector<std::string> CommandDispatcher::commands() const {
  std::vector<std::string> names;
  names.reserve(handlers_.size());
  for (const auto& [name, _] : handlers_)
    names.push_back(name);
  std::sort(names.begin(), names.end());
  return names;
}

json CommandDispatcher::dispatch(const json& request) const {
  if (!request.is_object() || !request.contains("cmd") || !request.at("cmd").is_string())
    return failure(ErrorKind::InvalidArgument, "request must be an object with a string 'cmd'");

  const auto cmd = request.at("cmd").get<std::string>();
  auto it = handlers_.find(cmd);
  if (it == handlers_.end())
    return failure(ErrorKind::InvalidArgument, "unknown command '" + cmd + "'");

  try {
    return it->second(request);
  } catch (const RingError& ex) {
    return failure(ex.kind(), ex.what());
  } catch (const json::exception& ex) {
    return failure(ErrorKind::InvalidArgument, ex.what());
  }
}

std::string CommandDispatcher::handleLine(const std::string& line) const {
  json request;
  try {
    request = json::parse(line);
  } catch (const json::parse_error& ex) {
    spdlog::debug("[Dispatcher] malformed request: {}", ex.what());
    return failure(ErrorKind::InvalidArgument, "malformed JSON").dump();
  }
  return dispatch(request).dump();
}

void CommandDispatcher::registerBuiltins() {
  //---commands-----------------------------------------------------------
  registerHandler("registerRing", [this](const json& req) {
    return toJson(service_.registerRing(requireString(req, "address"), optionalString(req, "name")));
  });
  registerHandler("renameRing", [this](const json& req) {
    return toJson(service_.renameRing(requireId(req), requireString(req, "name")));
  });
  registerHandler("removeRing",
                  [this](const json& req) { return toJson(service_.removeRing(requireId(req))); });
  registerHandler("connectRing",
                  [this](const json& req) { return toJson(service_.connectRing(requireId(req))); });
  registerHandler("disconnectRing", [this](const json& req) {
    return toJson(service_.disconnectRing(requireId(req)));
  });
  registerHandler("syncRing", [this](const json& req) {
    const auto res = service_.syncRing(requireId(req));
    return toJson(res.status, json{ { "stepsWritten", res.stepsWritten },
                                    { "heartRateWritten", res.heartRateWritten } });
  });
  registerHandler("setRingTime",
                  [this](const json& req) { return toJson(service_.setRingTime(requireId(req))); });
  registerHandler("rebootRing",
                  [this](const json& req) { return toJson(service_.rebootRing(requireId(req))); });

  //---queries------------------------------------------------------------
  registerHandler("listRings", [this](const json&) {
    json rings = json::array();
    for (const auto& ring : service_.listRings())
      rings.push_back(toJson(ring));
    return toJson(CommandResult::success(), std::move(rings));
  });
  registerHandler("getRing", [this](const json& req) {
    const RingId id = requireId(req);
    auto ring = service_.getRing(id);
    if (!ring)
      return failure(ErrorKind::NotFound, "unknown ring " + std::to_string(id));
    return toJson(CommandResult::success(), toJson(*ring));
  });
  registerHandler("rangeQuery", [this](const json& req) {
    auto cursor = service_.rangeQuery(requireId(req), requireMetric(req), requireTime(req, "since"),
                                      requireTime(req, "until"));
    json samples = json::array();
    while (auto s = cursor.next())
      samples.push_back(toJson(*s));
    return toJson(CommandResult::success(), std::move(samples));
  });
  registerHandler("aggregateByDay", [this](const json& req) {
    json days = json::array();
    for (const auto& day : service_.aggregateByDay(requireId(req), requireMetric(req),
                                                   requireTime(req, "since"),
                                                   requireTime(req, "until")))
      days.push_back(toJson(day));
    return toJson(CommandResult::success(), std::move(days));
  });
}
