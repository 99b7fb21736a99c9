/* @file TelemetryJournal.cpp
 * @brief buffered append-only file with fsync on flush - POSIX compliant
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring>
#include <fstream>
#include <utility>

// Linux headers
#include <unistd.h> // fsync()

// Third-party headers
#include <spdlog/spdlog.h>

// Zeddring headers
#include "io/TelemetryJournal.hpp"

using namespace zeddring::io;

TelemetryJournal::~TelemetryJournal() { close(); }

TelemetryJournal::TelemetryJournal(TelemetryJournal&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)) {}

TelemetryJournal& TelemetryJournal::operator=(TelemetryJournal&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool TelemetryJournal::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a+");
  if (!fp_) {
    spdlog::error("[Journal] open {}: {}", path, std::strerror(errno));
    return false;
  }

  // a torn last line must not swallow the next record
  if (std::fseek(fp_, -1, SEEK_END) == 0 && std::fgetc(fp_) != '\n')
    buffer_.push_back('\n');
  std::fseek(fp_, 0, SEEK_END); // a read must be followed by a seek before writing
  return true;
}

void TelemetryJournal::write(const std::string& line) {
  buffer_.insert(buffer_.end(), line.begin(), line.end());
  buffer_.push_back('\n');
}

bool TelemetryJournal::flush() {
  if (!fp_)
    return false;

  if (!buffer_.empty()) {
    const std::size_t written = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    if (written != buffer_.size()) {
      spdlog::error("[Journal] short write ({} of {} bytes): {}", written, buffer_.size(),
                    std::strerror(errno));
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(written));
      return false;
    }
    buffer_.clear();
  }

  if (std::fflush(fp_) != 0 || ::fsync(::fileno(fp_)) != 0) {
    spdlog::error("[Journal] flush: {}", std::strerror(errno));
    return false;
  }
  return true;
}

void TelemetryJournal::close() {
  if (!fp_)
    return;
  if (!flush())
    spdlog::warn("[Journal] {} byte(s) lost on close", buffer_.size());
  std::fclose(fp_);
  fp_ = nullptr;
  buffer_.clear();
}

bool TelemetryJournal::replay(const std::string& path,
                              const std::function<void(const std::string&)>& onLine) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    return false;

  std::string line;
  while (std::getline(in, line)) {
    if (in.eof())
      break; // no trailing '\n': torn write
    if (!line.empty())
      onLine(line);
  }
  return true;
}
