#pragma once
/** @file  BridgeResponse.hpp
 *  @brief One reply line from the BLE bridge dongle.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>

namespace zeddring {
  namespace protocols {

    /**
 * @struct BridgeResponse
 * @brief Parsed form of `<tag> OK [payload]`, `<tag> ERR reason` or a record
 *        line `<tag> S|H|D fields...` following a multi-line `OK <n>`.
 */
    struct BridgeResponse {
      enum class Kind : std::uint8_t { Ok, Err, Record };

      std::uint32_t tag{ 0 };
      Kind kind{ Kind::Err };
      std::string code{};    ///< OK, ERR, or the record type (S, H, D)
      std::string payload{}; ///< rest of the line, trimmed

      static std::optional<BridgeResponse> fromWire(const std::string& line) {
        std::string text = line;
        while (!text.empty() && (text.back() == '\r' || text.back() == '\n' || text.back() == ' '))
          text.pop_back();

        const auto tagEnd = text.find(' ');
        if (tagEnd == std::string::npos || tagEnd == 0)
          return std::nullopt;

        BridgeResponse r;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + tagEnd, r.tag);
        if (ec != std::errc{} || ptr != text.data() + tagEnd)
          return std::nullopt;

        const auto codeStart = text.find_first_not_of(' ', tagEnd);
        if (codeStart == std::string::npos)
          return std::nullopt;
        const auto codeEnd = text.find(' ', codeStart);
        r.code = text.substr(codeStart, codeEnd - codeStart);
        if (codeEnd != std::string::npos) {
          const auto payloadStart = text.find_first_not_of(' ', codeEnd);
          if (payloadStart != std::string::npos)
            r.payload = text.substr(payloadStart);
        }

        if (r.code == "OK")
          r.kind = Kind::Ok;
        else if (r.code == "ERR")
          r.kind = Kind::Err;
        else if (r.code == "S" || r.code == "H" || r.code == "D")
          r.kind = Kind::Record;
        else
          return std::nullopt;
        return r;
      }
    };

  } // namespace protocols
} // namespace zeddring
