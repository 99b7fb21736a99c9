#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace zeddring::core {

  /**
 * @class ErrorMonitor
 * @brief Subsystems call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique, still-active error.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so the dashboard doesn't get spammed by a
 *   ring that keeps hitting its retry limit.
 * * `fatal()` is reserved for unrecoverable storage faults and never returns.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that is told about every new failure.
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; forwards to the escalation callback once.
    virtual void notifyFailure(const std::string& message);

    /// The condition behind \p message went away; a later repeat escalates again.
    virtual void clearFailure(const std::string& message);

    /// Snapshot of failures that were notified and not cleared yet.
    std::vector<std::string> activeFailures() const;

    /// Log critical, escalate, abort the process.
    [[noreturn]] void fatal(const std::string& message);

  private:
    bool rememberIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace zeddring::core
