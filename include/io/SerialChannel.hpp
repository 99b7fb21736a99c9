#pragma once
/** @file  SerialChannel.hpp
 *  @brief Non-blocking line I/O over a tty (bridge dongle) or a pair of pipes (control channel).
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

// Linux header
#include <termios.h> // for speed_t types e.g., B115200

namespace zeddring {
  namespace io {

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a /dev/tty* file descriptor.
 *
 *  * Writes ASCII lines terminated with `\r\n`; reads lines ending in `\n`
 *    (a preceding `\r` is stripped).
 *  * `attach()` borrows already-open descriptors (stdin/stdout) instead of
 *    opening a device; borrowed descriptors are never closed.
 *  * *Non-copyable*, but move-constructible.
 */

    class SerialChannel {

    public:
      //---ctr / dtr--------------------------------------------
      SerialChannel() = default;
      virtual ~SerialChannel(); // close the /dev/tty fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& dev, speed_t baud);
      virtual void attach(int readFd, int writeFd);
      virtual bool writeLine(const std::string& line); // returns false on EIO
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual bool isOpen() const { return readFd_ >= 0; }
      void close();

      //---non-copyable-----------------------------------------
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SerialChannel(SerialChannel&& other) noexcept;
      SerialChannel& operator=(SerialChannel&& other) noexcept;

    private:
      std::optional<std::string> takeLine();

      int readFd_{ -1 };        ///< POSIX fd (-1==closed)
      int writeFd_{ -1 };       ///< same as readFd_ for a tty
      bool owned_{ false };     ///< opened by us, closed by us
      std::string rx_buffer_{}; ///< buffer to store readLine content
    };
  } // namespace io
} // namespace zeddring
