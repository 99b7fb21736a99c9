#pragma once
/** @file  ManualTimeSource.hpp
 *  @brief TimeSource that only moves when a test says so.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

#include <mutex>

#include "core/TimeSource.hpp"

namespace zeddring {
  namespace test {

    class ManualTimeSource : public zeddring::core::TimeSource {
    public:
      explicit ManualTimeSource(zeddring::core::Timestamp start) : now_(start) {}

      zeddring::core::Timestamp now() const override {
        std::lock_guard<std::mutex> lock(mtx_);
        return now_;
      }

      template <typename Duration> void advance(Duration d) {
        std::lock_guard<std::mutex> lock(mtx_);
        now_ += std::chrono::duration_cast<zeddring::core::Timestamp::duration>(d);
      }

    private:
      mutable std::mutex mtx_;
      zeddring::core::Timestamp now_;
    };

  } // namespace test
} // namespace zeddring
