/* @file ConnectionStateMachine.cpp
 * @brief transition table + retry ledger for a single ring
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// Third-party headers
#include <spdlog/spdlog.h>

// Zeddring headers
#include "core/ConnectionStateMachine.hpp"

using namespace zeddring::core;

namespace {

  bool edgeAllowed(ConnectionState from, ConnectionState to) {
    using S = ConnectionState;
    if (to == S::Disconnected)
      return true; // forced disconnect wins from anywhere
    switch (from) {
    case S::Disconnected:
    case S::Backoff:
      return to == S::Connecting;
    case S::Connecting:
      return to == S::Connected || to == S::Backoff;
    case S::Connected:
      return false;
    default:
      return false;
    }
  }

} // namespace

ConnectionStateMachine::ConnectionStateMachine(RingId id, RetryPolicy policy, Listener listener,
                                               RingStatus initial)
    : id_(id), policy_(policy), listener_(std::move(listener)), status_(std::move(initial)) {
  // connection state is never carried across a restart
  status_.state = ConnectionState::Disconnected;
}

bool ConnectionStateMachine::isDue(Timestamp now) const {
  switch (status_.state) {
  case ConnectionState::Disconnected:
  case ConnectionState::Backoff:
    return !status_.ledger.nextRetry || now >= *status_.ledger.nextRetry;
  default:
    return false;
  }
}

bool ConnectionStateMachine::limitReached() const {
  return status_.ledger.failures >= policy_.maxAttempts;
}

void ConnectionStateMachine::beginConnect(Timestamp now) {
  transitionTo(ConnectionState::Connecting);
  status_.lastAttempt = now;
  publish();
}

void ConnectionStateMachine::connectSucceeded(Timestamp now) {
  transitionTo(ConnectionState::Connected);
  status_.ledger = RetryLedger{};
  status_.lastSuccess = now;
  status_.needsAttention = false;
  status_.lastError.clear();
  publish();
}

void ConnectionStateMachine::connectFailed(Timestamp now, ErrorKind kind,
                                           const std::string& reason) {
  transitionTo(ConnectionState::Backoff);
  ++status_.ledger.failures;

  if (limitReached()) {
    status_.ledger.nextRetry = now + policy_.extendedDelay;
    status_.needsAttention = true;
  } else {
    status_.ledger.nextRetry = now + policy_.retryDelay;
  }
  status_.lastError = std::string(toString(kind)) + ": " + reason;

  spdlog::warn("[FSM] ring {} connect failed ({}), failure {}/{}", id_, status_.lastError,
               status_.ledger.failures, policy_.maxAttempts);
  publish();
}

void ConnectionStateMachine::cancel() {
  if (status_.state != ConnectionState::Connecting)
    throw std::logic_error("[FSM] cancel() outside Connecting");
  transitionTo(ConnectionState::Disconnected);
  status_.lastError = "cancelled";
  publish();
}

void ConnectionStateMachine::linkLost(Timestamp now, const std::string& reason) {
  if (status_.state != ConnectionState::Connected)
    throw std::logic_error("[FSM] linkLost() on a ring that is not Connected");
  transitionTo(ConnectionState::Disconnected);
  // a healthy link dropping is not a connection failure: ledger untouched
  status_.lastAttempt = now;
  status_.lastError = "link lost: " + reason;
  spdlog::warn("[FSM] ring {} {}", id_, status_.lastError);
  publish();
}

void ConnectionStateMachine::forceDisconnect(const std::string& reason) {
  transitionTo(ConnectionState::Disconnected);
  status_.lastError = reason;
  publish();
}

void ConnectionStateMachine::contactAttempted(Timestamp now) {
  status_.lastAttempt = now;
  publish();
}

void ConnectionStateMachine::contactSucceeded(Timestamp now) {
  status_.lastSuccess = now;
  publish();
}

void ConnectionStateMachine::transitionTo(ConnectionState next) {
  if (!edgeAllowed(status_.state, next)) {
    throw std::logic_error(std::string("[FSM] illegal transition ") + toString(status_.state) +
                           " -> " + toString(next));
  }
  if (status_.state != next)
    spdlog::info("[FSM] ring {} {} -> {}", id_, toString(status_.state), toString(next));
  status_.state = next;
}

void ConnectionStateMachine::publish() const {
  if (listener_)
    listener_(id_, status_);
}
