/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault fan-out and the fatal escalation path
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstdlib>

// Third-party headers
#include <spdlog/spdlog.h>

// Zeddring headers
#include "core/ErrorMonitor.hpp"

using namespace zeddring::core;

void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
  std::lock_guard<std::mutex> lock(mtx_);
  escalation_ = std::move(cb);
}

void ErrorMonitor::notifyFailure(const std::string& message) {
  if (!rememberIfNew(message))
    return;

  spdlog::warn("[ErrorMonitor] {}", message);

  std::function<void(const std::string&)> cb;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    cb = escalation_;
  }
  // invoked outside the lock so the callback may query activeFailures()
  if (cb)
    cb(message);
}

void ErrorMonitor::clearFailure(const std::string& message) {
  std::lock_guard<std::mutex> lock(mtx_);
  seen_.erase(std::remove(seen_.begin(), seen_.end(), message), seen_.end());
}

std::vector<std::string> ErrorMonitor::activeFailures() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return seen_;
}

void ErrorMonitor::fatal(const std::string& message) {
  spdlog::critical("[ErrorMonitor] fatal: {}", message);

  std::function<void(const std::string&)> cb;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    cb = escalation_;
  }
  if (cb)
    cb(message);

  spdlog::shutdown();
  std::abort();
}

bool ErrorMonitor::rememberIfNew(const std::string& message) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
    return false;
  seen_.push_back(message);
  return true;
}
