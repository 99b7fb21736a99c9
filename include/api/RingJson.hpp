#pragma once
/** @file  RingJson.hpp
 *  @brief JSON renderings of the value types sent over the control channel.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

// Third-party headers
#include <nlohmann/json.hpp>

// Zeddring headers
#include "core/Errors.hpp"
#include "core/Types.hpp"

namespace zeddring::api {

  /// Timestamps become ISO-8601 UTC strings; absent values become null.
  nlohmann::json toJson(const core::Ring& ring);
  nlohmann::json toJson(const core::Sample& sample);
  nlohmann::json toJson(const core::DayAggregate& day);

  /// {"ok", "error", "message", "data"}
  nlohmann::json toJson(const core::CommandResult& result,
                        nlohmann::json data = nlohmann::json());

} // namespace zeddring::api
