/* @file TelemetryStore.cpp
 * @brief journaled append-only series + lazy cursors + daily aggregates
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <charconv>
#include <filesystem>
#include <limits>
#include <map>
#include <mutex>
#include <sstream>

// Third-party headers
#include <spdlog/spdlog.h>

// Zeddring headers
#include "core/TelemetryStore.hpp"
#include "core/TimeSource.hpp"

using namespace zeddring::core;

namespace {

  template <typename T> bool parseNumber(const std::string& text, T& out) {
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
  }

} // namespace

// -------------------------------------------------------------------
// SampleCursor
// -------------------------------------------------------------------
SampleCursor::SampleCursor(const TelemetryStore* store, RingId ring, Metric metric,
                           Timestamp since, Timestamp until, std::uint64_t watermark)
    : store_(store), ring_(ring), metric_(metric), since_(since), until_(until),
      watermark_(watermark) {}

std::optional<Sample> SampleCursor::next() {
  if (buffer_.empty() && !exhausted_)
    refill();
  if (buffer_.empty())
    return std::nullopt;

  Sample s = buffer_.front();
  buffer_.pop_front();
  return s;
}

std::vector<Sample> SampleCursor::collect() {
  std::vector<Sample> out;
  while (auto s = next())
    out.push_back(*s);
  return out;
}

void SampleCursor::refill() {
  std::shared_lock lock(store_->mtx_);

  const auto it = store_->series_.find(TelemetryStore::SeriesKey{ ring_, metric_ });
  if (it == store_->series_.end() || since_ > until_) {
    exhausted_ = true;
    return;
  }
  const auto& series = it->second;

  Sample bound;
  TelemetryStore::Series::const_iterator pos;
  if (lastKey_) {
    bound.timestamp = lastKey_->first;
    bound.seq = lastKey_->second;
    pos = series.upper_bound(bound);
  } else {
    bound.timestamp = since_;
    bound.seq = 0;
    pos = series.lower_bound(bound);
  }

  // lastKey_ tracks the last *examined* entry so skipped (too new) samples
  // are not rescanned on the next refill
  for (; pos != series.end() && buffer_.size() < kChunk; ++pos) {
    if (pos->timestamp > until_) {
      exhausted_ = true;
      return;
    }
    lastKey_ = std::make_pair(pos->timestamp, pos->seq);
    if (pos->seq < watermark_)
      buffer_.push_back(*pos);
  }
  if (pos == series.end())
    exhausted_ = true;
}

// -------------------------------------------------------------------
// TelemetryStore
// -------------------------------------------------------------------
std::unique_ptr<TelemetryStore> TelemetryStore::open(const std::string& journalPath) {
  auto store = std::make_unique<TelemetryStore>();

  std::size_t rejected = 0;
  if (std::filesystem::exists(journalPath)) {
    const bool readable = io::TelemetryJournal::replay(journalPath, [&](const std::string& line) {
      if (auto s = fromJournalLine(line))
        store->insertLocked(*s);
      else
        ++rejected;
    });
    if (!readable)
      throw StorageError("[Store] cannot read journal " + journalPath);
  }
  if (rejected > 0)
    spdlog::warn("[Store] skipped {} malformed journal line(s) in {}", rejected, journalPath);

  std::error_code ec;
  const std::filesystem::path p(journalPath);
  if (p.has_parent_path())
    std::filesystem::create_directories(p.parent_path(), ec);

  auto journal = std::make_unique<io::TelemetryJournal>();
  if (!journal->open(journalPath))
    throw StorageError("[Store] cannot open journal " + journalPath + " for append");
  store->journal_ = std::move(journal);

  spdlog::info("[Store] {} sample(s) replayed from {}", store->count_, journalPath);
  return store;
}

void TelemetryStore::append(Sample sample) {
  std::vector<Sample> one{ std::move(sample) };
  appendBatch(std::move(one));
}

void TelemetryStore::appendBatch(std::vector<Sample> samples) {
  if (samples.empty())
    return;

  std::unique_lock lock(mtx_);
  journalLocked(samples);
  for (auto& s : samples)
    insertLocked(std::move(s));
}

SampleCursor TelemetryStore::rangeQuery(RingId ring, Metric metric, Timestamp since,
                                        Timestamp until) const {
  std::shared_lock lock(mtx_);
  return SampleCursor(this, ring, metric, since, until, nextSeq_);
}

std::vector<DayAggregate> TelemetryStore::aggregateByDay(RingId ring, Metric metric,
                                                         Timestamp since, Timestamp until) const {
  std::map<std::string, DayAggregate> days; // YYYY-MM-DD sorts chronologically
  std::map<std::string, double> sums;

  auto cursor = rangeQuery(ring, metric, since, until);
  while (auto s = cursor.next()) {
    const std::string day = utcDay(s->timestamp);
    auto [it, inserted] = days.try_emplace(day);
    DayAggregate& agg = it->second;
    if (inserted) {
      agg.day = day;
      agg.min = std::numeric_limits<std::int64_t>::max();
      agg.max = std::numeric_limits<std::int64_t>::min();
    }
    agg.min = std::min(agg.min, s->value);
    agg.max = std::max(agg.max, s->value);
    ++agg.count;
    sums[day] += static_cast<double>(s->value);
  }

  std::vector<DayAggregate> out;
  out.reserve(days.size());
  for (auto& [day, agg] : days) {
    agg.avg = sums[day] / static_cast<double>(agg.count);
    out.push_back(agg);
  }
  return out;
}

std::size_t TelemetryStore::size() const {
  std::shared_lock lock(mtx_);
  return count_;
}

std::string TelemetryStore::toJournalLine(const Sample& s) {
  std::ostringstream line;
  line << s.ringId << ',' << toString(s.metric) << ',' << toEpochMillis(s.timestamp) << ','
       << s.value;
  return line.str();
}

std::optional<Sample> TelemetryStore::fromJournalLine(const std::string& line) {
  std::vector<std::string> fields;
  std::stringstream ss(line);
  std::string field;
  while (std::getline(ss, field, ','))
    fields.push_back(field);
  if (fields.size() != 4)
    return std::nullopt;

  Sample s;
  std::int64_t epochMs = 0;
  const auto metric = metricFromString(fields[1]);
  if (!parseNumber(fields[0], s.ringId) || !metric || !parseNumber(fields[2], epochMs) ||
      !parseNumber(fields[3], s.value))
    return std::nullopt;

  s.metric = *metric;
  s.timestamp = fromEpochMillis(epochMs);
  return s;
}

void TelemetryStore::insertLocked(Sample sample) {
  sample.seq = nextSeq_++;
  series_[SeriesKey{ sample.ringId, sample.metric }].insert(std::move(sample));
  ++count_;
}

void TelemetryStore::journalLocked(const std::vector<Sample>& samples) {
  if (!journal_)
    return;
  for (const auto& s : samples)
    journal_->write(toJournalLine(s));
  if (!journal_->flush())
    throw StorageError("[Store] journal write failed");
}
