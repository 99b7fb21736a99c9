// Zeddring-Prod headers
#include "core/TelemetryStore.hpp"
#include "core/TimeSource.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>
#include <vector>

namespace zeddring::test {

  using namespace zeddring::core;
  using namespace std::chrono_literals;
  namespace fs = std::filesystem;

  namespace {
    const Timestamp kDay{ std::chrono::sys_days{ std::chrono::year{ 2026 } / 5 / 10 } };

    Sample at(RingId ring, Metric m, Timestamp t, std::int64_t v) {
      return Sample{ ring, m, t, v, 0 };
    }

    std::vector<std::int64_t> values(std::vector<Sample> samples) {
      std::vector<std::int64_t> out;
      for (const auto& s : samples)
        out.push_back(s.value);
      return out;
    }
  } // namespace

  TEST(telemetry_store, out_of_order_inserts_read_back_sorted) {
    TelemetryStore store;
    store.append(at(1, Metric::HeartRate, kDay + 3s, 3));
    store.append(at(1, Metric::HeartRate, kDay + 1s, 1));
    store.append(at(1, Metric::HeartRate, kDay + 2s, 2));

    auto got = store.rangeQuery(1, Metric::HeartRate, kDay, kDay + 1h).collect();
    EXPECT_EQ(values(got), (std::vector<std::int64_t>{ 1, 2, 3 }));
  }

  TEST(telemetry_store, equal_timestamps_keep_insertion_order) {
    TelemetryStore store;
    store.appendBatch({ at(1, Metric::Steps, kDay, 10), at(1, Metric::Steps, kDay, 20),
                        at(1, Metric::Steps, kDay, 30) });
    EXPECT_EQ(values(store.rangeQuery(1, Metric::Steps, kDay, kDay).collect()),
              (std::vector<std::int64_t>{ 10, 20, 30 }));
  }

  TEST(telemetry_store, range_bounds_are_inclusive) {
    TelemetryStore store;
    for (int i = 0; i < 5; ++i)
      store.append(at(1, Metric::Battery, kDay + std::chrono::minutes(i), 90 - i));

    EXPECT_EQ(values(store.rangeQuery(1, Metric::Battery, kDay + 1min, kDay + 3min).collect()),
              (std::vector<std::int64_t>{ 89, 88, 87 }));
    EXPECT_TRUE(store.rangeQuery(1, Metric::Battery, kDay + 3min, kDay + 1min).collect().empty());
    EXPECT_TRUE(store.rangeQuery(2, Metric::Battery, kDay, kDay + 1h).collect().empty());
  }

  TEST(telemetry_store, samples_unaffected_by_unrelated_writes) {
    TelemetryStore store;
    store.append(at(1, Metric::HeartRate, kDay + 5s, 61));
    const auto before = store.rangeQuery(1, Metric::HeartRate, kDay, kDay + 1h).collect();

    store.append(at(2, Metric::HeartRate, kDay + 5s, 99));
    store.append(at(1, Metric::Steps, kDay + 5s, 5000));
    store.append(at(1, Metric::HeartRate, kDay + 2h, 70));

    const auto after = store.rangeQuery(1, Metric::HeartRate, kDay, kDay + 1h).collect();
    ASSERT_EQ(after.size(), before.size());
    EXPECT_EQ(after[0].ringId, before[0].ringId);
    EXPECT_EQ(after[0].metric, before[0].metric);
    EXPECT_EQ(after[0].timestamp, before[0].timestamp);
    EXPECT_EQ(after[0].value, before[0].value);
    EXPECT_EQ(after[0].seq, before[0].seq);
  }

  TEST(telemetry_store, cursor_sees_only_writes_committed_before_the_query) {
    TelemetryStore store;
    for (int i = 0; i < 600; ++i)
      store.append(at(1, Metric::Steps, kDay + std::chrono::seconds(i), i));

    auto cursor = store.rangeQuery(1, Metric::Steps, kDay, kDay + 1h);
    std::vector<Sample> got;
    for (int i = 0; i < 300; ++i)
      got.push_back(*cursor.next());

    // lands both behind and ahead of the cursor position
    store.append(at(1, Metric::Steps, kDay + 10s, -1));
    store.append(at(1, Metric::Steps, kDay + 500s, -2));

    while (auto s = cursor.next())
      got.push_back(*s);
    ASSERT_EQ(got.size(), 600u);
    for (std::size_t i = 0; i < got.size(); ++i)
      EXPECT_EQ(got[i].value, static_cast<std::int64_t>(i));

    // a fresh query is a restart and includes the later writes
    EXPECT_EQ(store.rangeQuery(1, Metric::Steps, kDay, kDay + 1h).collect().size(), 602u);
  }

  TEST(telemetry_store, aggregates_by_utc_day) {
    TelemetryStore store;
    store.appendBatch({ at(1, Metric::HeartRate, kDay + 1h, 60),
                        at(1, Metric::HeartRate, kDay + 23h, 80),
                        at(1, Metric::HeartRate, kDay + 25h, 100),
                        at(1, Metric::HeartRate, kDay + 2h, 70) });

    auto days = store.aggregateByDay(1, Metric::HeartRate, kDay, kDay + 48h);
    ASSERT_EQ(days.size(), 2u);
    EXPECT_EQ(days[0].day, "2026-05-10");
    EXPECT_EQ(days[0].min, 60);
    EXPECT_EQ(days[0].max, 80);
    EXPECT_DOUBLE_EQ(days[0].avg, 70.0);
    EXPECT_EQ(days[0].count, 3u);
    EXPECT_EQ(days[1].day, "2026-05-11");
    EXPECT_EQ(days[1].count, 1u);
  }

  TEST(telemetry_store, duplicates_leave_daily_min_max_unchanged) {
    TelemetryStore store;
    const std::vector<Sample> history{ at(1, Metric::Steps, kDay + 1h, 300),
                                       at(1, Metric::Steps, kDay + 2h, 900) };
    store.appendBatch(history);
    const auto once = store.aggregateByDay(1, Metric::Steps, kDay, kDay + 24h);
    store.appendBatch(history);
    const auto twice = store.aggregateByDay(1, Metric::Steps, kDay, kDay + 24h);

    ASSERT_EQ(once.size(), 1u);
    ASSERT_EQ(twice.size(), 1u);
    EXPECT_EQ(twice[0].min, once[0].min);
    EXPECT_EQ(twice[0].max, once[0].max);
    EXPECT_EQ(twice[0].count, 2 * once[0].count);
  }

  TEST(telemetry_store, concurrent_writers_lose_nothing) {
    TelemetryStore store;
    constexpr int kWriters = 4;
    constexpr int kEach = 500;

    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
      writers.emplace_back([&store, w] {
        for (int i = 0; i < kEach; ++i)
          store.append(at(1, Metric::HeartRate, kDay + std::chrono::milliseconds(i * kWriters + w),
                          i));
      });
    }
    std::thread reader([&store] {
      for (int i = 0; i < 50; ++i)
        store.rangeQuery(1, Metric::HeartRate, kDay, kDay + 1h).collect();
    });
    for (auto& t : writers)
      t.join();
    reader.join();

    const auto all = store.rangeQuery(1, Metric::HeartRate, kDay, kDay + 1h).collect();
    ASSERT_EQ(all.size(), static_cast<std::size_t>(kWriters * kEach));
    for (std::size_t i = 1; i < all.size(); ++i)
      EXPECT_LE(all[i - 1].timestamp, all[i].timestamp);
  }

  TEST(telemetry_store, journal_line_format) {
    const Sample s = at(12, Metric::Steps, fromEpochMillis(1760000000123), 4321);
    EXPECT_EQ(TelemetryStore::toJournalLine(s), "12,steps,1760000000123,4321");
    EXPECT_FALSE(TelemetryStore::fromJournalLine("12,steps,17600"));
    EXPECT_FALSE(TelemetryStore::fromJournalLine("12,calories,1,2"));
    EXPECT_FALSE(TelemetryStore::fromJournalLine("x,steps,1,2"));
  }

  class JournaledStoreTest : public ::testing::Test {
  protected:
    void SetUp() override {
      dir = fs::temp_directory_path() /
            ("zeddring_store_" + std::to_string(::getpid()) + "_" +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
      fs::remove_all(dir);
      path = (dir / "telemetry.csv").string();
    }
    void TearDown() override { fs::remove_all(dir); }

    fs::path dir;
    std::string path;
  };

  TEST_F(JournaledStoreTest, samples_survive_reopen) {
    {
      auto store = TelemetryStore::open(path);
      store->append(at(1, Metric::Battery, kDay + 2s, 77));
      store->appendBatch({ at(1, Metric::Battery, kDay + 1s, 78), at(2, Metric::Steps, kDay, 9) });
    }
    auto reopened = TelemetryStore::open(path);
    EXPECT_EQ(reopened->size(), 3u);
    EXPECT_EQ(values(reopened->rangeQuery(1, Metric::Battery, kDay, kDay + 1h).collect()),
              (std::vector<std::int64_t>{ 78, 77 }));
  }

  TEST_F(JournaledStoreTest, torn_and_malformed_lines_are_skipped) {
    fs::create_directories(dir);
    {
      std::ofstream out(path);
      out << TelemetryStore::toJournalLine(at(1, Metric::Steps, kDay, 10)) << '\n'
          << "garbage line\n"
          << TelemetryStore::toJournalLine(at(1, Metric::Steps, kDay + 1s, 11)) << '\n'
          << "1,steps,17"; // crash mid-write
    }
    auto store = TelemetryStore::open(path);
    EXPECT_EQ(values(store->rangeQuery(1, Metric::Steps, kDay, kDay + 1h).collect()),
              (std::vector<std::int64_t>{ 10, 11 }));
  }

} // namespace zeddring::test
