/* @file SerialChannel.cpp
 * @brief IO abstraction layer that wraps ttyACMx / stdio - handles file descriptor, framing, line io and RAII - POSIX compliant
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <poll.h>
#include <unistd.h> // write(), read(), close()

// Third-party headers
#include <spdlog/spdlog.h>

// Zeddring headers
#include "io/SerialChannel.hpp"

using namespace zeddring::io;

SerialChannel::~SerialChannel() { close(); }

SerialChannel::SerialChannel(SerialChannel&& other) noexcept
    : readFd_(std::exchange(other.readFd_, -1)), writeFd_(std::exchange(other.writeFd_, -1)),
      owned_(std::exchange(other.owned_, false)), rx_buffer_(std::move(other.rx_buffer_)) {}

SerialChannel& SerialChannel::operator=(SerialChannel&& other) noexcept {
  if (this != &other) {
    close();
    readFd_ = std::exchange(other.readFd_, -1);
    writeFd_ = std::exchange(other.writeFd_, -1);
    owned_ = std::exchange(other.owned_, false);
    rx_buffer_ = std::move(other.rx_buffer_);
  }
  return *this;
}

bool SerialChannel::open(const std::string& dev, speed_t baud) {
  close();
  // open non-blocking, dont become ctrl-TTY
  const int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) {
    spdlog::error("[Serial] open {}: {} ({})", dev, strerror(errno), errno);
    return false;
  }
  readFd_ = writeFd_ = fd;
  owned_ = true;

  // fetch current attrs
  struct termios tty;
  if (tcgetattr(fd, &tty) != 0) {
    spdlog::error("[Serial] tcgetattr {}: {}", dev, strerror(errno));
    close();
    return false;
  }

  cfmakeraw(&tty);
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8;
  tty.c_cflag &= ~CRTSCTS;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  cfsetispeed(&tty, baud);
  cfsetospeed(&tty, baud);

  if (tcsetattr(fd, TCSANOW, &tty) != 0) {
    spdlog::error("[Serial] tcsetattr {}: {}", dev, strerror(errno));
    close();
    return false;
  }
  spdlog::debug("[Serial] {} open", dev);
  return true;
}

void SerialChannel::attach(int readFd, int writeFd) {
  close();
  readFd_ = readFd;
  writeFd_ = writeFd;
  owned_ = false;
}

bool SerialChannel::writeLine(const std::string& line) {

  if (writeFd_ < 0) {
    return false;
  }

  std::string out = line;
  if (!out.ends_with("\r\n")) {
    out += "\r\n";
  }

  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::write(writeFd_, out.data() + total, out.size() - total);
    if (written > 0) {
      total += written;
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ writeFd_, POLLOUT, 0 };
      ::poll(&pfd, 1, 100);
    } else {
      spdlog::error("[Serial] write: {} ({})", strerror(errno), errno);
      return false;
    }
  }

  return true;
}

std::optional<std::string> SerialChannel::takeLine() {
  const auto pos = rx_buffer_.find('\n');
  if (pos == std::string::npos)
    return std::nullopt;
  std::string line = rx_buffer_.substr(0, pos);
  rx_buffer_.erase(0, pos + 1);
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  return line;
}

// -------------------------------------------------------------------
// SerialChannel::readLine
// Non-blocking line reader with timeout and internal buffer.
// Returns std::nullopt on timeout, disconnect, or error.
// -------------------------------------------------------------------
std::optional<std::string> SerialChannel::readLine(std::chrono::milliseconds timeout) {
  if (auto line = takeLine())
    return line; // left over from the previous read

  if (readFd_ < 0)
    return std::nullopt;

  char temp[256];
  pollfd pfd{ readFd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {

    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = static_cast<int>(ms_left.count());

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      spdlog::error("[Serial] poll: {}", strerror(errno));
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & (POLLIN | POLLHUP)) {
      ssize_t n = ::read(readFd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, n);
      } else if (n == 0) { // EOF / disconnect
        close();
        return std::nullopt;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        spdlog::error("[Serial] read: {}", strerror(errno));
        return std::nullopt;
      }

      if (auto line = takeLine())
        return line;
    } else if (pfd.revents & (POLLERR | POLLNVAL)) {
      close();
      return std::nullopt;
    }
  }
  return std::nullopt; // timeout/partial
}

void SerialChannel::close() {
  if (owned_ && readFd_ >= 0)
    ::close(readFd_);
  readFd_ = writeFd_ = -1;
  owned_ = false;
}
