#pragma once
/** @file  TelemetryStore.hpp
 *  @brief Append-only (ring, metric, timestamp) time-series with range and daily queries.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Zeddring headers
#include "core/Errors.hpp"
#include "core/Types.hpp"
#include "io/TelemetryJournal.hpp"

namespace zeddring {
  namespace core {

    class TelemetryStore;

    /**
 * @class SampleCursor
 * @brief Lazy, finite, ascending walk over one series.
 *
 *  * Pulls chunks from the store on demand under a shared lock.
 *  * Sees exactly the samples committed before rangeQuery() was called:
 *    later appends carry a higher sequence number and are skipped.
 *  * The store must outlive the cursor.
 */
    class SampleCursor {
    public:
      std::optional<Sample> next();

      /// Drain the remaining samples.
      std::vector<Sample> collect();

    private:
      friend class TelemetryStore;
      SampleCursor(const TelemetryStore* store, RingId ring, Metric metric, Timestamp since,
                   Timestamp until, std::uint64_t watermark);

      void refill();

      static constexpr std::size_t kChunk = 256;

      const TelemetryStore* store_;
      RingId ring_;
      Metric metric_;
      Timestamp since_;
      Timestamp until_;
      std::uint64_t watermark_; ///< first seq that is *not* visible
      std::optional<std::pair<Timestamp, std::uint64_t>> lastKey_{};
      std::deque<Sample> buffer_{};
      bool exhausted_{ false };
    };

    /**
 * @class TelemetryStore
 * @brief Thread-safe in-memory index over a durable CSV journal.
 *
 *  * Writers (scheduler workers, sync) take the exclusive lock for the
 *    duration of one append/batch; each call is journaled and fsynced before
 *    it returns. A journal failure throws StorageError.
 *  * Series are ordered by (timestamp, insertion seq), so out-of-order
 *    inserts read back sorted and ties keep insertion order.
 */
    class TelemetryStore {
    public:
      /// Memory-only store (tests, dry runs).
      TelemetryStore() = default;

      /// Replay \p journalPath if it exists, then append to it. @throws StorageError
      static std::unique_ptr<TelemetryStore> open(const std::string& journalPath);

      TelemetryStore(const TelemetryStore&) = delete;
      TelemetryStore& operator=(const TelemetryStore&) = delete;

      //---writes-----------------------------------------------------------
      void append(Sample sample);
      void appendBatch(std::vector<Sample> samples);

      //---reads------------------------------------------------------------
      /// Inclusive [since, until].
      SampleCursor rangeQuery(RingId ring, Metric metric, Timestamp since, Timestamp until) const;
      std::vector<DayAggregate> aggregateByDay(RingId ring, Metric metric, Timestamp since,
                                               Timestamp until) const;
      std::size_t size() const;

      /// "ringId,metric,epochMillis,value"
      static std::string toJournalLine(const Sample& s);
      static std::optional<Sample> fromJournalLine(const std::string& line);

    private:
      friend class SampleCursor;

      struct SeriesKey {
        RingId ring;
        Metric metric;
        bool operator==(const SeriesKey& o) const { return ring == o.ring && metric == o.metric; }
      };
      struct SeriesKeyHash {
        std::size_t operator()(const SeriesKey& k) const {
          return std::hash<std::uint64_t>{}((static_cast<std::uint64_t>(k.ring) << 8) |
                                            static_cast<std::uint64_t>(k.metric));
        }
      };
      struct ByTimeThenSeq {
        bool operator()(const Sample& a, const Sample& b) const {
          return a.timestamp != b.timestamp ? a.timestamp < b.timestamp : a.seq < b.seq;
        }
      };
      using Series = std::set<Sample, ByTimeThenSeq>;

      void insertLocked(Sample sample); ///< assigns seq
      void journalLocked(const std::vector<Sample>& samples);

      mutable std::shared_mutex mtx_;
      std::unordered_map<SeriesKey, Series, SeriesKeyHash> series_{};
      std::uint64_t nextSeq_{ 1 };
      std::size_t count_{ 0 };
      std::unique_ptr<io::TelemetryJournal> journal_{};
    };

  } // namespace core
} // namespace zeddring
