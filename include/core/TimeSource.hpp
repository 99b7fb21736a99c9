#pragma once
/** @file  TimeSource.hpp
 *  @brief Injectable wall clock plus timestamp formatting helpers.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>

// Zeddring headers
#include "core/Types.hpp"

namespace zeddring {
  namespace core {

    /**
     * @class TimeSource
     * @brief Wall-clock provider. Tests substitute a manually advanced clock.
     */
    class TimeSource {
    public:
      virtual ~TimeSource() = default;
      virtual Timestamp now() const = 0;
    };

    class SystemTimeSource final : public TimeSource {
    public:
      Timestamp now() const override { return std::chrono::system_clock::now(); }
    };

    std::int64_t toEpochMillis(Timestamp t);
    Timestamp fromEpochMillis(std::int64_t ms);

    /// "2026-10-17T08:30:00.250Z"
    std::string toIso8601(Timestamp t);

    /// Accepts "YYYY-MM-DDTHH:MM:SS[.mmm]Z" and "YYYY-MM-DD"; std::nullopt otherwise.
    std::optional<Timestamp> parseIso8601(const std::string& text);

    /// UTC calendar day of \p t as "YYYY-MM-DD".
    std::string utcDay(Timestamp t);

  } // namespace core
} // namespace zeddring
