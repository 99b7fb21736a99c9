#pragma once
/** @file  Types.hpp
 *  @brief Value types shared by the registry, state machine, scheduler and store.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace zeddring {
  namespace core {

    using Timestamp = std::chrono::system_clock::time_point;
    using RingId = std::uint32_t;

    //---connection state------------------------------------------------
    enum class ConnectionState : std::uint8_t { Disconnected, Connecting, Connected, Backoff };

    inline const char* toString(ConnectionState s) {
      switch (s) {
      case ConnectionState::Disconnected:
        return "Disconnected";
      case ConnectionState::Connecting:
        return "Connecting";
      case ConnectionState::Connected:
        return "Connected";
      case ConnectionState::Backoff:
        return "Backoff";
      default:
        return "Unknown";
      }
    }

    //---metrics-----------------------------------------------------------
    enum class Metric : std::uint8_t { HeartRate, Steps, Battery, Count };
    static_assert(static_cast<std::uint8_t>(Metric::Count) == 3,
                  "Metric count changed please update code that depends on it");

    inline const char* toString(Metric m) {
      switch (m) {
      case Metric::HeartRate:
        return "heart_rate";
      case Metric::Steps:
        return "steps";
      case Metric::Battery:
        return "battery";
      default:
        return "unknown";
      }
    }

    /// Inverse of toString(Metric); std::nullopt for unknown names.
    std::optional<Metric> metricFromString(const std::string& name);

    /**
     * @struct RetryPolicy
     * @brief Fixed-delay retry settings consumed by ConnectionStateMachine.
     *
     *  * Every failed connect holds the ring for `retryDelay`.
     *  * Once `maxAttempts` consecutive failures accumulate the hold becomes
     *    `extendedDelay` and the ring is flagged for attention.
     */
    struct RetryPolicy {
      std::chrono::seconds retryDelay{ 300 };
      std::chrono::seconds extendedDelay{ 1800 };
      unsigned maxAttempts{ 3 };
    };

    /// Per-ring failure bookkeeping. Reset on every transition into Connected.
    struct RetryLedger {
      unsigned failures{ 0 };
      std::optional<Timestamp> nextRetry{};
    };

    struct RingStatus {
      ConnectionState state{ ConnectionState::Disconnected };
      RetryLedger ledger{};
      std::optional<Timestamp> lastSuccess{}; ///< last successful contact
      std::optional<Timestamp> lastAttempt{}; ///< last attempted contact
      bool needsAttention{ false };           ///< retry limit reached
      std::string lastError{};                ///< human-readable reason, empty when healthy
    };

    struct Readings {
      std::optional<std::int64_t> battery{};
      std::optional<std::int64_t> heartRate{};
      std::optional<std::int64_t> steps{};
    };

    /**
     * @struct Ring
     * @brief One registered wearable. Owned by RingRegistry; everyone else
     *        works on copies.
     */
    struct Ring {
      RingId id{ 0 };
      std::string address{}; ///< normalised XX:XX:XX:XX:XX:XX, immutable
      std::string name{};
      RingStatus status{};
      Readings readings{};
      bool pendingDeletion{ false };
    };

    /// One immutable telemetry reading. `seq` is assigned by TelemetryStore.
    struct Sample {
      RingId ringId{ 0 };
      Metric metric{ Metric::HeartRate };
      Timestamp timestamp{};
      std::int64_t value{ 0 };
      std::uint64_t seq{ 0 };
    };

    struct DayAggregate {
      std::string day{}; ///< YYYY-MM-DD (UTC)
      std::int64_t min{ 0 };
      std::int64_t max{ 0 };
      double avg{ 0.0 };
      std::size_t count{ 0 };
    };

  } // namespace core
} // namespace zeddring
