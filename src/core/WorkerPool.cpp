/* @file WorkerPool.cpp
 * @brief FIFO job queue drained by N std::threads
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <exception>

// Third-party headers
#include <spdlog/spdlog.h>

// Zeddring headers
#include "core/WorkerPool.hpp"

using namespace zeddring::core;

WorkerPool::WorkerPool(std::size_t threads) {
  const std::size_t n = std::max<std::size_t>(1, threads);
  workers_.reserve(n);
  for (std::size_t i = 0; i < n; ++i)
    workers_.emplace_back([this] { workerLoop(); });
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    stopping_ = true;
  }
  work_.notify_all();
  for (auto& t : workers_) {
    if (t.joinable())
      t.join();
  }
}

void WorkerPool::submit(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    queue_.push_back(std::move(job));
  }
  work_.notify_one();
}

void WorkerPool::waitIdle() {
  std::unique_lock<std::mutex> lock(mtx_);
  idle_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
}

void WorkerPool::workerLoop() {
  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      work_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty())
        return; // stopping and drained
      job = std::move(queue_.front());
      queue_.pop_front();
      ++active_;
    }

    try {
      job();
    } catch (const std::exception& ex) {
      spdlog::error("[WorkerPool] job failed: {}", ex.what());
    }

    {
      std::lock_guard<std::mutex> lock(mtx_);
      --active_;
      if (queue_.empty() && active_ == 0)
        idle_.notify_all();
    }
  }
}
