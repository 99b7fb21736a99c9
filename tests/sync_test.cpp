// Zeddring-Prod headers
#include "core/SyncOrchestrator.hpp"

// Zeddring-Fake headers
#include "RingHarness.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

namespace zeddring::test {

  using namespace zeddring::core;
  using namespace std::chrono_literals;

  class SyncTest : public ::testing::Test {
  protected:
    void SetUp() override {
      id = h.add("AA:BB:CC:DD:EE:FF");
      const auto base = h.clock.now() - 3h;
      h.driver.history.steps = { { base, 400 }, { base + 1h, 250 } };
      h.driver.history.heartRate = { { base, 64 }, { base + 30min, 0 }, { base + 1h, 90 } };
    }

    void connect() { ASSERT_TRUE(h.service.connectRing(id).ok); }

    RingHarness h;
    RingId id{ 0 };
  };

  TEST_F(SyncTest, unknown_ring_is_not_found) {
    const auto res = h.sync.syncHistory(999);
    EXPECT_FALSE(res.status.ok);
    EXPECT_EQ(res.status.error, ErrorKind::NotFound);
  }

  TEST_F(SyncTest, requires_a_connected_ring) {
    const auto res = h.sync.syncHistory(id);
    EXPECT_FALSE(res.status.ok);
    EXPECT_EQ(res.status.error, ErrorKind::DeviceUnavailable);
    EXPECT_EQ(h.driver.count("readHistory"), 0);
  }

  TEST_F(SyncTest, writes_history_with_recorded_timestamps_and_drops_zero_hr) {
    connect();
    const auto res = h.sync.syncHistory(id);
    ASSERT_TRUE(res.status.ok) << res.status.message;
    EXPECT_EQ(res.stepsWritten, 2u);
    EXPECT_EQ(res.heartRateWritten, 2u);

    const auto base = h.clock.now() - 3h;
    const auto hr = h.store.rangeQuery(id, Metric::HeartRate, base, base + 2h).collect();
    ASSERT_EQ(hr.size(), 2u);
    EXPECT_EQ(hr[0].timestamp, base);
    EXPECT_EQ(hr[0].value, 64);
    EXPECT_EQ(hr[1].timestamp, base + 1h);
    EXPECT_EQ(h.status(id).lastSuccess, h.clock.now());
  }

  TEST_F(SyncTest, syncing_twice_duplicates_without_moving_daily_extremes) {
    connect();
    const auto from = h.clock.now() - 24h;
    const auto to = h.clock.now();

    ASSERT_TRUE(h.sync.syncHistory(id).status.ok);
    const auto once = h.store.aggregateByDay(id, Metric::Steps, from, to);
    ASSERT_TRUE(h.sync.syncHistory(id).status.ok);
    const auto twice = h.store.aggregateByDay(id, Metric::Steps, from, to);

    ASSERT_EQ(once.size(), twice.size());
    for (std::size_t i = 0; i < once.size(); ++i) {
      EXPECT_EQ(twice[i].min, once[i].min);
      EXPECT_EQ(twice[i].max, once[i].max);
      EXPECT_EQ(twice[i].count, 2 * once[i].count);
    }
  }

  TEST_F(SyncTest, transport_failure_marks_link_lost) {
    connect();
    h.driver.failReadsWith(ErrorKind::TransportFailure);
    const auto res = h.sync.syncHistory(id);
    EXPECT_FALSE(res.status.ok);
    EXPECT_EQ(res.status.error, ErrorKind::TransportFailure);
    EXPECT_EQ(h.status(id).state, ConnectionState::Disconnected);
    EXPECT_EQ(h.status(id).ledger.failures, 0u);
  }

  TEST_F(SyncTest, removal_during_sync_discards_the_batch) {
    connect();
    h.driver.onCall = [this](const std::string& op) {
      if (op == "readHistory")
        h.service.removeRing(id);
    };
    const auto res = h.sync.syncHistory(id);
    EXPECT_FALSE(res.status.ok);
    EXPECT_EQ(res.status.error, ErrorKind::Cancelled);
    EXPECT_EQ(h.store.size(), 0u);
    EXPECT_FALSE(h.registry.get(id));
  }

  TEST(sync_concurrency, at_most_one_call_in_flight_per_ring) {
    auto cfg = harnessConfig();
    cfg.syncTimeOnConnect = false;
    RingHarness h(cfg);
    h.driver.callDelay = 2ms;
    h.driver.history.steps = { { h.clock.now() - 1h, 10 } };

    std::vector<RingId> ids;
    const char* addrs[] = { "10:00:00:00:00:01", "10:00:00:00:00:02", "10:00:00:00:00:03",
                            "10:00:00:00:00:04" };
    for (const char* a : addrs)
      ids.push_back(h.add(a));
    h.tick(); // every ring Connected before the load starts

    std::atomic<bool> done{ false };
    std::thread ticker([&] {
      for (int i = 0; i < 15; ++i) {
        h.scheduler.tick();
        std::this_thread::sleep_for(5ms);
      }
      h.scheduler.waitIdle();
      done = true;
    });

    std::vector<std::thread> syncers;
    for (int t = 0; t < 3; ++t) {
      syncers.emplace_back([&, t] {
        std::size_t n = 0;
        while (!done) {
          const RingId id = ids[(n++ + t) % ids.size()];
          h.service.syncRing(id);
          h.service.setRingTime(id);
        }
      });
    }

    ticker.join();
    for (auto& s : syncers)
      s.join();

    for (const char* a : addrs)
      EXPECT_LE(h.driver.maxInFlight(a), 1) << a;
    EXPECT_GT(h.driver.count("readHistory"), 0);
  }

} // namespace zeddring::test
