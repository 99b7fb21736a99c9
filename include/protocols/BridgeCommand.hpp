#pragma once
/** @file  BridgeCommand.hpp
 *  @brief One request line for the BLE bridge dongle.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>
#include <vector>

namespace zeddring {
  namespace protocols {

    /// "<tag> VERB arg arg\r\n"; the dongle echoes the tag on every reply line.
    struct BridgeCommand {
      std::uint32_t tag{ 0 };
      std::string verb{};
      std::vector<std::string> args{};

      std::string toWire() const {
        std::string out = std::to_string(tag) + ' ' + verb;
        for (const auto& a : args)
          out += ' ' + a;
        return out + "\r\n";
      }
    };

  } // namespace protocols
} // namespace zeddring
