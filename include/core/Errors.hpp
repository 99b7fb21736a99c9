#pragma once
/** @file  Errors.hpp
 *  @brief Error taxonomy, typed exceptions and the structured command result.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

// Zeddring headers
#include "core/Types.hpp"

namespace zeddring {
  namespace core {

    enum class ErrorKind : std::uint8_t {
      None,
      TransportTimeout,
      TransportFailure,
      DuplicateAddress,
      NotFound,
      DeviceUnavailable,
      Cancelled,
      InvalidArgument,
    };

    inline const char* toString(ErrorKind k) {
      switch (k) {
      case ErrorKind::None:
        return "None";
      case ErrorKind::TransportTimeout:
        return "TransportTimeout";
      case ErrorKind::TransportFailure:
        return "TransportFailure";
      case ErrorKind::DuplicateAddress:
        return "DuplicateAddress";
      case ErrorKind::NotFound:
        return "NotFound";
      case ErrorKind::DeviceUnavailable:
        return "DeviceUnavailable";
      case ErrorKind::Cancelled:
        return "Cancelled";
      case ErrorKind::InvalidArgument:
        return "InvalidArgument";
      default:
        return "Unknown";
      }
    }

    /**
     * @class TransportError
     * @brief Raised by device drivers. Kind is TransportTimeout or TransportFailure.
     *
     *  * Never escapes the scheduler; ConnectionStateMachine turns it into a transition.
     */
    class TransportError : public std::runtime_error {
    public:
      TransportError(ErrorKind kind, const std::string& what)
          : std::runtime_error(what), kind_(kind) {}
      ErrorKind kind() const noexcept { return kind_; }

    private:
      ErrorKind kind_;
    };

    /// Caller mistakes against the registry (unknown id, duplicate address, bad input).
    class RingError : public std::runtime_error {
    public:
      RingError(ErrorKind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}
      ErrorKind kind() const noexcept { return kind_; }

    private:
      ErrorKind kind_;
    };

    /// Durable storage could not be written. Treated as fatal by callers.
    class StorageError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /**
     * @struct CommandResult
     * @brief What every API command hands back instead of throwing.
     */
    struct CommandResult {
      bool ok{ true };
      ErrorKind error{ ErrorKind::None };
      std::string message{};
      std::optional<RingId> ringId{}; ///< ring the command acted on (set by registerRing)

      static CommandResult success(std::string message = {}) {
        return CommandResult{ true, ErrorKind::None, std::move(message), std::nullopt };
      }
      static CommandResult failure(ErrorKind kind, std::string message) {
        return CommandResult{ false, kind, std::move(message), std::nullopt };
      }
    };

  } // namespace core
} // namespace zeddring
