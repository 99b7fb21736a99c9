#pragma once
/** @file  OperationLocks.hpp
 *  @brief Per-ring operation lock, the one primitive that serializes device access.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

// Zeddring headers
#include "core/ConnectionStateMachine.hpp"
#include "core/Types.hpp"

namespace zeddring::drivers {
  class GuardedDriver;
}

namespace zeddring::core {

  class RingRegistry;
  class OperationLocks;

  /// Lock + state machine of one ring. Only reachable through RingSession.
  struct RingSlot {
    RingSlot(const Ring& ring, RetryPolicy policy, ConnectionStateMachine::Listener listener);

    const RingId id;
    const std::string address;
    ConnectionStateMachine fsm; ///< touched only while `busy` is held

    std::mutex mtx;
    std::condition_variable cv;
    bool busy{ false };
    bool disconnectRequested{ false };
    std::atomic<bool> retired{ false }; ///< ring removed; purge after release
  };

  /**
 * @class RingSession
 * @brief Move-only proof of holding a ring's operation lock.
 *
 *  * Released on destruction or `release()`, from whichever thread owns the
 *    session at that point (the tick thread acquires, a worker releases).
 *  * Release applies deferred work first: a disconnect requested while the
 *    lock was busy, or the purge of a removed ring.
 */
  class RingSession {
  public:
    RingSession() = default;
    ~RingSession();

    RingSession(RingSession&& other) noexcept;
    RingSession& operator=(RingSession&& other) noexcept;
    RingSession(const RingSession&) = delete;
    RingSession& operator=(const RingSession&) = delete;

    explicit operator bool() const { return slot_ != nullptr; }

    RingId id() const { return slot_->id; }
    const std::string& address() const { return slot_->address; }
    ConnectionStateMachine& fsm() { return slot_->fsm; }
    const ConnectionStateMachine& fsm() const { return slot_->fsm; }

    /// Ring removed while we hold the lock: stop issuing driver calls.
    bool cancelled() const { return slot_->retired.load(); }
    /// Someone asked for a disconnect while we hold the lock.
    bool disconnectPending() const;

    void release();

  private:
    friend class OperationLocks;
    RingSession(std::shared_ptr<RingSlot> slot, OperationLocks* owner);

    std::shared_ptr<RingSlot> slot_{};
    OperationLocks* owner_{ nullptr };
  };

  /**
 * @class OperationLocks
 * @brief Owns one RingSlot per ring and hands out RingSessions.
 *
 *  * Shared by Scheduler, SyncOrchestrator and RingService: this is what
 *    guarantees at most one in-flight driver call per ring.
 *  * Different rings never contend with each other.
 */
  class OperationLocks {
  public:
    OperationLocks(RingRegistry& registry, drivers::GuardedDriver& driver, RetryPolicy policy);

    /// Blocks until the ring is free. @throws RingError NotFound (unknown or removed ring)
    RingSession acquire(RingId id);

    /// Empty session if the ring is busy. @throws RingError NotFound
    RingSession tryAcquire(RingId id);

    /// Free ring: returns a session. Busy ring: records the disconnect request
    /// for the holder to apply on release and returns an empty session.
    RingSession acquireOrRequestDisconnect(RingId id);

    /// Ring already marked removed in the registry: purge now if idle, else
    /// leave it to the current holder.
    void retire(RingId id);

    /// Number of rings with a live slot (diagnostics).
    std::size_t slotCount() const;

  private:
    friend class RingSession;

    std::shared_ptr<RingSlot> slotFor(RingId id);
    void finish(RingSlot& slot); ///< RingSession release path
    void disconnectForRelease(RingSlot& slot, const std::string& reason);
    void purge(RingId id);

    RingRegistry& registry_;
    drivers::GuardedDriver& driver_;
    RetryPolicy policy_;

    mutable std::mutex mtx_;
    std::unordered_map<RingId, std::shared_ptr<RingSlot>> slots_{};
  };

} // namespace zeddring::core
