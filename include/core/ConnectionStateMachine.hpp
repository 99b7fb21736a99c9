#pragma once
/** @file  ConnectionStateMachine.hpp
 *  @brief Per-ring Disconnected/Connecting/Connected/Backoff FSM with retry accounting.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <functional>
#include <string>

// Zeddring headers
#include "core/Errors.hpp"
#include "core/Types.hpp"

namespace zeddring {
  namespace core {

    /**
 * @class ConnectionStateMachine
 * @brief Owns the transition edges of one ring and its Retry Ledger.
 *
 *  * Not thread-safe on its own: only touched by the holder of the ring's
 *    operation lock (see OperationLocks).
 *  * Every transition publishes a full RingStatus snapshot to the listener,
 *    which is how RingRegistry readers see state changes.
 *  * An edge not in the table below is a programming error and throws
 *    `std::logic_error`.
 *
 *      Disconnected -> Connecting        beginConnect()
 *      Backoff      -> Connecting        beginConnect()
 *      Connecting   -> Connected         connectSucceeded()
 *      Connecting   -> Backoff           connectFailed()
 *      Connecting   -> Disconnected      cancel()
 *      Connected    -> Disconnected      linkLost()
 *      any          -> Disconnected      forceDisconnect()
 */
    class ConnectionStateMachine {
    public:
      using Listener = std::function<void(RingId, const RingStatus&)>;

      ConnectionStateMachine(RingId id, RetryPolicy policy, Listener listener = {},
                             RingStatus initial = {});

      //---queries----------------------------------------------------------
      ConnectionState state() const { return status_.state; }
      const RingStatus& status() const { return status_; }
      RingId id() const { return id_; }

      /// True when the scheduler may start an automatic connect at \p now.
      bool isDue(Timestamp now) const;

      /// Consecutive failures reached RetryPolicy::maxAttempts.
      bool limitReached() const;

      //---transitions------------------------------------------------------
      void beginConnect(Timestamp now);
      void connectSucceeded(Timestamp now);
      void connectFailed(Timestamp now, ErrorKind kind, const std::string& reason);
      void cancel();
      void linkLost(Timestamp now, const std::string& reason);
      void forceDisconnect(const std::string& reason);

      //---bookkeeping without a state change--------------------------------
      void contactAttempted(Timestamp now);
      void contactSucceeded(Timestamp now);

    private:
      void transitionTo(ConnectionState next);
      void publish() const;

      RingId id_;
      RetryPolicy policy_;
      Listener listener_;
      RingStatus status_;
    };

  } // namespace core
} // namespace zeddring
