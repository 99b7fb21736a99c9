/* @file Scheduler.cpp
 * @brief tick loop: snapshot registry, lock free rings, dispatch connect/poll jobs
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <memory>

// Third-party headers
#include <spdlog/spdlog.h>

// Zeddring headers
#include "core/ErrorMonitor.hpp"
#include "core/OperationLocks.hpp"
#include "core/RingOperations.hpp"
#include "core/RingRegistry.hpp"
#include "core/Scheduler.hpp"
#include "core/TimeSource.hpp"

using namespace zeddring::core;

Scheduler::Scheduler(RingRegistry& registry, OperationLocks& locks, RingOperations& ops,
                     ErrorMonitor& errors, const AppConfig& config, const TimeSource& clock)
    : registry_(registry), locks_(locks), ops_(ops), errors_(errors), config_(config),
      clock_(clock), pool_(config.workerThreads) {}

Scheduler::~Scheduler() { stop(); }

void Scheduler::start() {
  if (running_.exchange(true))
    return;
  thread_ = std::thread([this] { loop(); });
  spdlog::info("[Scheduler] started (interval {} s, {} worker(s))", config_.scanInterval.count(),
               pool_.threadCount());
}

void Scheduler::stop() {
  if (!running_.exchange(false))
    return;
  wake_.notify_all();
  if (thread_.joinable())
    thread_.join();
  pool_.waitIdle();
  disconnectAll();
  spdlog::info("[Scheduler] stopped");
}

void Scheduler::loop() {
  while (running_) {
    tick();
    std::unique_lock<std::mutex> lock(mtx_);
    wake_.wait_for(lock, config_.scanInterval, [this] { return !running_; });
  }
}

std::size_t Scheduler::tick() {
  try {
    registry_.flush();
    if (config_.autoDiscover)
      ops_.discover(config_.scanTimeout, config_.discoverPrefix);
  } catch (const StorageError& ex) {
    errors_.fatal(ex.what());
  }

  const auto now = clock_.now();
  std::size_t dispatched = 0;

  for (const auto& ring : dispatchOrder()) {
    RingSession session;
    try {
      session = locks_.tryAcquire(ring.id);
    } catch (const RingError&) {
      continue; // removed since the snapshot
    }
    if (!session) {
      spdlog::debug("[Scheduler] ring {} busy, skipped this tick", ring.id);
      continue;
    }

    const auto state = session.fsm().state();
    if (state != ConnectionState::Connected && !session.fsm().isDue(now))
      continue; // still held by the retry ledger; session releases here

    // std::function needs a copyable callable
    auto held = std::make_shared<RingSession>(std::move(session));
    pool_.submit([this, held] {
      runJob(*held);
      held->release();
    });
    ++dispatched;
  }
  return dispatched;
}

void Scheduler::waitIdle() { pool_.waitIdle(); }

void Scheduler::runJob(RingSession& session) {
  try {
    if (session.fsm().state() != ConnectionState::Connected) {
      if (ops_.connect(session) != ErrorKind::None)
        return;
    }
    ops_.poll(session);
  } catch (const StorageError& ex) {
    errors_.fatal(ex.what());
  }
}

std::vector<Ring> Scheduler::dispatchOrder() const {
  auto rings = registry_.list();
  if (config_.persistentConnection) {
    // rings that were connected before go first: they are the ones with data gaps
    std::stable_partition(rings.begin(), rings.end(),
                          [](const Ring& r) { return r.status.lastSuccess.has_value(); });
  }
  return rings;
}

void Scheduler::disconnectAll() {
  for (const auto& ring : registry_.list()) {
    if (ring.status.state != ConnectionState::Connected)
      continue;
    try {
      auto session = locks_.acquire(ring.id);
      ops_.disconnect(session, "scheduler stopped");
    } catch (const RingError&) {
      // removed meanwhile
    }
  }
  try {
    registry_.flush();
  } catch (const StorageError& ex) {
    spdlog::error("[Scheduler] final registry flush failed: {}", ex.what());
  }
}
