/* @file RingJson.cpp
 * @brief value types -> nlohmann::json
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <optional>
#include <utility>

// Zeddring headers
#include "api/RingJson.hpp"
#include "core/TimeSource.hpp"

using json = nlohmann::json;

namespace {

  json isoOrNull(const std::optional<zeddring::core::Timestamp>& t) {
    return t ? json(zeddring::core::toIso8601(*t)) : json(nullptr);
  }

  json valueOrNull(const std::optional<std::int64_t>& v) { return v ? json(*v) : json(nullptr); }

} // namespace

namespace zeddring::api {

  json toJson(const core::Ring& ring) {
    const auto& st = ring.status;
    return json{
      { "id", ring.id },
      { "name", ring.name },
      { "address", ring.address },
      { "state", core::toString(st.state) },
      { "failures", st.ledger.failures },
      { "heldUntil", isoOrNull(st.ledger.nextRetry) },
      { "needsAttention", st.needsAttention },
      { "lastError", st.lastError.empty() ? json(nullptr) : json(st.lastError) },
      { "battery", valueOrNull(ring.readings.battery) },
      { "heartRate", valueOrNull(ring.readings.heartRate) },
      { "steps", valueOrNull(ring.readings.steps) },
      { "lastSuccess", isoOrNull(st.lastSuccess) },
      { "lastAttempt", isoOrNull(st.lastAttempt) },
    };
  }

  json toJson(const core::Sample& sample) {
    return json{ { "timestamp", core::toIso8601(sample.timestamp) }, { "value", sample.value } };
  }

  json toJson(const core::DayAggregate& day) {
    return json{ { "day", day.day },
                 { "min", day.min },
                 { "max", day.max },
                 { "avg", day.avg },
                 { "count", day.count } };
  }

  json toJson(const core::CommandResult& result, json data) {
    json out{ { "ok", result.ok },
              { "error", core::toString(result.error) },
              { "message", result.message },
              { "data", std::move(data) } };
    if (result.ringId)
      out["id"] = *result.ringId;
    return out;
  }

} // namespace zeddring::api
