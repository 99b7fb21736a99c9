#pragma once
/** @file  WorkerPool.hpp
 *  @brief Fixed-size thread pool the scheduler dispatches per-ring jobs to.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace zeddring {
  namespace core {

    class WorkerPool {

    public:
      explicit WorkerPool(std::size_t threads);
      ~WorkerPool(); ///< drains the queue, then joins

      WorkerPool(const WorkerPool&) = delete;
      WorkerPool& operator=(const WorkerPool&) = delete;

      // --- public API ---
      void submit(std::function<void()> job); ///< FIFO, non-blocking
      void waitIdle();                        ///< queue empty and no job running
      std::size_t threadCount() const { return workers_.size(); }

    private:
      void workerLoop();

      std::mutex mtx_;
      std::condition_variable work_;
      std::condition_variable idle_;
      std::deque<std::function<void()>> queue_;
      std::size_t active_{ 0 };
      bool stopping_{ false };
      std::vector<std::thread> workers_;
    };

  } // namespace core
} // namespace zeddring
