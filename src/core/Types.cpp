/* @file Types.cpp
 * @brief name lookups for the shared enums
 *
 * © 2025 Zeddring — MIT-licensed.
 */

#include "core/Types.hpp"

std::optional<zeddring::core::Metric> zeddring::core::metricFromString(const std::string& name) {
  for (auto m : { Metric::HeartRate, Metric::Steps, Metric::Battery }) {
    if (name == toString(m))
      return m;
  }
  return std::nullopt;
}

