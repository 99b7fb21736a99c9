/* @file OperationLocks.cpp
 * @brief per-ring ownership tokens, deferred disconnect and deferred purge
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <utility>

// Third-party headers
#include <spdlog/spdlog.h>

// Zeddring headers
#include "core/Errors.hpp"
#include "core/OperationLocks.hpp"
#include "core/RingRegistry.hpp"
#include "drivers/GuardedDriver.hpp"

using namespace zeddring::core;

// -------------------------------------------------------------------
// RingSlot / RingSession
// -------------------------------------------------------------------
RingSlot::RingSlot(const Ring& ring, RetryPolicy policy, ConnectionStateMachine::Listener listener)
    : id(ring.id), address(ring.address), fsm(ring.id, policy, std::move(listener), ring.status) {}

RingSession::RingSession(std::shared_ptr<RingSlot> slot, OperationLocks* owner)
    : slot_(std::move(slot)), owner_(owner) {}

RingSession::~RingSession() { release(); }

RingSession::RingSession(RingSession&& other) noexcept
    : slot_(std::move(other.slot_)), owner_(std::exchange(other.owner_, nullptr)) {}

RingSession& RingSession::operator=(RingSession&& other) noexcept {
  if (this != &other) {
    release();
    slot_ = std::move(other.slot_);
    owner_ = std::exchange(other.owner_, nullptr);
  }
  return *this;
}

bool RingSession::disconnectPending() const {
  std::lock_guard<std::mutex> lock(slot_->mtx);
  return slot_->disconnectRequested;
}

void RingSession::release() {
  if (!slot_)
    return;
  auto slot = std::exchange(slot_, nullptr);
  std::exchange(owner_, nullptr)->finish(*slot);
}

// -------------------------------------------------------------------
// OperationLocks
// -------------------------------------------------------------------
OperationLocks::OperationLocks(RingRegistry& registry, drivers::GuardedDriver& driver,
                               RetryPolicy policy)
    : registry_(registry), driver_(driver), policy_(policy) {}

std::shared_ptr<RingSlot> OperationLocks::slotFor(RingId id) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (auto it = slots_.find(id); it != slots_.end())
    return it->second;

  const auto ring = registry_.get(id);
  if (!ring || ring->pendingDeletion)
    throw RingError(ErrorKind::NotFound, "[Locks] unknown ring " + std::to_string(id));

  auto slot = std::make_shared<RingSlot>(
      *ring, policy_, [this](RingId rid, const RingStatus& status) {
        registry_.updateStatus(rid, status);
      });
  slots_.emplace(id, slot);
  return slot;
}

RingSession OperationLocks::acquire(RingId id) {
  auto slot = slotFor(id);
  {
    std::unique_lock<std::mutex> lock(slot->mtx);
    slot->cv.wait(lock, [&] { return !slot->busy; });
    slot->busy = true;
  }
  RingSession session(slot, this);
  if (slot->retired) {
    session.release();
    throw RingError(ErrorKind::NotFound, "[Locks] ring " + std::to_string(id) + " was removed");
  }
  return session;
}

RingSession OperationLocks::tryAcquire(RingId id) {
  auto slot = slotFor(id);
  {
    std::lock_guard<std::mutex> lock(slot->mtx);
    if (slot->busy)
      return {};
    slot->busy = true;
  }
  RingSession session(slot, this);
  if (slot->retired) {
    session.release();
    throw RingError(ErrorKind::NotFound, "[Locks] ring " + std::to_string(id) + " was removed");
  }
  return session;
}

RingSession OperationLocks::acquireOrRequestDisconnect(RingId id) {
  auto slot = slotFor(id);
  {
    std::lock_guard<std::mutex> lock(slot->mtx);
    if (slot->busy) {
      slot->disconnectRequested = true;
      spdlog::info("[Locks] ring {} busy, disconnect deferred until release", id);
      return {};
    }
    slot->busy = true;
  }
  RingSession session(slot, this);
  if (slot->retired) {
    session.release();
    throw RingError(ErrorKind::NotFound, "[Locks] ring " + std::to_string(id) + " was removed");
  }
  return session;
}

void OperationLocks::retire(RingId id) {
  std::shared_ptr<RingSlot> slot;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (auto it = slots_.find(id); it != slots_.end())
      slot = it->second;
  }
  if (!slot) {
    // never operated on: nothing can be in flight
    registry_.purge(id);
    return;
  }

  slot->retired = true;
  {
    std::lock_guard<std::mutex> lock(slot->mtx);
    if (slot->busy) {
      spdlog::info("[Locks] ring {} busy, purge deferred until release", id);
      return;
    }
    slot->busy = true;
  }
  finish(*slot);
}

std::size_t OperationLocks::slotCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return slots_.size();
}

void OperationLocks::finish(RingSlot& slot) {
  for (;;) {
    bool wantDisconnect = false;
    {
      std::lock_guard<std::mutex> lock(slot.mtx);
      wantDisconnect = std::exchange(slot.disconnectRequested, false);
      const bool linkToDrop = slot.retired && slot.fsm.state() != ConnectionState::Disconnected;
      if (!wantDisconnect && !linkToDrop) {
        slot.busy = false;
        break;
      }
    }
    // still the holder here: the driver call stays serialized
    disconnectForRelease(slot, slot.retired ? "ring removed" : "disconnected by user");
  }
  slot.cv.notify_all();

  if (slot.retired)
    purge(slot.id);
}

void OperationLocks::disconnectForRelease(RingSlot& slot, const std::string& reason) {
  if (slot.fsm.state() == ConnectionState::Connected) {
    try {
      driver_.disconnect(slot.address);
    } catch (const TransportError& ex) {
      spdlog::warn("[Locks] ring {} disconnect failed: {}", slot.id, ex.what());
    }
  }
  slot.fsm.forceDisconnect(reason);
}

void OperationLocks::purge(RingId id) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    slots_.erase(id);
  }
  registry_.purge(id);
}
