#pragma once
/** @file  CommandDispatcher.hpp
 *  @brief Runtime registry that maps control-channel command names to handlers.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

// Third-party headers
#include <nlohmann/json.hpp>

namespace zeddring::api {

  class RingService;

  /**
 * @class CommandDispatcher
 * @brief One JSON request in, one JSON response out.
 *
 *  * Request:  `{"cmd": "connectRing", "id": 3}`
 *  * Response: `{"ok": true, "error": "None", "message": "...", "data": ...}`
 *  * Unknown commands, malformed JSON and bad arguments answer
 *    InvalidArgument; nothing thrown by a handler escapes `dispatch()`
 *    except a fatal storage fault, which never returns.
 */
  class CommandDispatcher {
  public:
    using Handler = std::function<nlohmann::json(const nlohmann::json& request)>;

    /// Registers every RingService command and query.
    explicit CommandDispatcher(RingService& service);

    /// Register a handler under \p name.  Returns false on duplicate.
    bool registerHandler(const std::string& name, Handler handler);

    nlohmann::json dispatch(const nlohmann::json& request) const;

    /// Parse one line, dispatch, serialise the response (no trailing newline).
    std::string handleLine(const std::string& line) const;

    /// Registered command names, sorted.
    std::vector<std::string> commands() const;

  private:
    void registerBuiltins();

    RingService& service_;
    std::unordered_map<std::string, Handler> handlers_;
  };

} // namespace zeddring::api
