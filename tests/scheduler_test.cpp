// Zeddring-Prod headers
#include "core/RingOperations.hpp"
#include "core/Scheduler.hpp"

// Zeddring-Fake headers
#include "RingHarness.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <thread>

namespace zeddring::test {

  using namespace zeddring::core;
  using namespace std::chrono_literals;
  using ::testing::_;

  namespace {
    constexpr const char* kAddr = "AA:BB:CC:DD:EE:FF";

    std::size_t series(const TelemetryStore& store, RingId id, Metric m) {
      return store.rangeQuery(id, m, Timestamp::min(), Timestamp::max()).collect().size();
    }
  } // namespace

  TEST(scheduler, registered_ring_connects_and_collects_one_sample_per_metric) {
    RingHarness h;
    const auto id = h.add(kAddr);
    EXPECT_EQ(h.status(id).state, ConnectionState::Disconnected);

    EXPECT_EQ(h.tick(), 1u);

    const auto st = h.status(id);
    EXPECT_EQ(st.state, ConnectionState::Connected);
    EXPECT_EQ(st.lastSuccess, h.clock.now());
    EXPECT_EQ(series(h.store, id, Metric::Battery), 1u);
    EXPECT_EQ(series(h.store, id, Metric::Steps), 1u);
    EXPECT_EQ(series(h.store, id, Metric::HeartRate), 1u);

    const auto ring = *h.registry.get(id);
    EXPECT_EQ(ring.readings.battery, 80);
    EXPECT_EQ(ring.readings.steps, 1234);
    EXPECT_EQ(ring.readings.heartRate, 72);
    EXPECT_EQ(h.driver.clockSets().size(), 1u);
  }

  TEST(scheduler, connected_ring_is_polled_without_reconnecting) {
    RingHarness h;
    const auto id = h.add(kAddr);
    h.tick();
    h.clock.advance(60s);
    h.tick();

    EXPECT_EQ(h.driver.count("connect"), 1);
    EXPECT_EQ(h.driver.count("readBattery"), 2);
    EXPECT_EQ(series(h.store, id, Metric::Battery), 2u);
  }

  TEST(scheduler, zero_heart_rate_is_not_stored) {
    RingHarness h;
    const auto id = h.add(kAddr);
    h.driver.heartRate = 0;
    h.tick();

    EXPECT_EQ(series(h.store, id, Metric::HeartRate), 0u);
    EXPECT_EQ(series(h.store, id, Metric::Battery), 1u);
    EXPECT_FALSE(h.registry.get(id)->readings.heartRate);
  }

  TEST(scheduler, three_failures_reach_backoff_and_escalate_once) {
    RingHarness h;
    const auto id = h.add(kAddr);
    h.driver.failNextConnects(3);
    EXPECT_CALL(h.errors, notifyFailure(RingOperations::attentionMessage(id))).Times(1);

    h.tick();
    auto st = h.status(id);
    EXPECT_EQ(st.state, ConnectionState::Backoff);
    EXPECT_EQ(st.ledger.failures, 1u);
    EXPECT_EQ(st.ledger.nextRetry, h.clock.now() + 300s);
    EXPECT_FALSE(st.needsAttention);

    // held: nothing dispatched until the retry time
    EXPECT_EQ(h.tick(), 0u);
    h.clock.advance(299s);
    EXPECT_EQ(h.tick(), 0u);

    h.clock.advance(1s);
    EXPECT_EQ(h.tick(), 1u);
    h.clock.advance(300s);
    EXPECT_EQ(h.tick(), 1u);

    st = h.status(id);
    EXPECT_EQ(st.state, ConnectionState::Backoff);
    EXPECT_EQ(st.ledger.failures, 3u);
    ASSERT_TRUE(st.ledger.nextRetry);
    EXPECT_EQ(*st.ledger.nextRetry, h.clock.now() + 1800s);
    EXPECT_TRUE(st.needsAttention);
    EXPECT_EQ(h.driver.count("connect"), 3);
  }

  TEST(scheduler, success_after_backoff_resets_the_ledger) {
    RingHarness h;
    const auto id = h.add(kAddr);
    h.driver.failNextConnects(1);
    EXPECT_CALL(h.errors, clearFailure(_)).Times(::testing::AtLeast(1));

    h.tick();
    h.clock.advance(300s);
    h.tick();

    const auto st = h.status(id);
    EXPECT_EQ(st.state, ConnectionState::Connected);
    EXPECT_EQ(st.ledger.failures, 0u);
    EXPECT_FALSE(st.ledger.nextRetry);
  }

  TEST(scheduler, lost_link_is_not_a_failure_and_reconnects_next_tick) {
    RingHarness h;
    const auto id = h.add(kAddr);
    h.tick();

    h.driver.failReadsWith(ErrorKind::TransportTimeout);
    h.tick();
    auto st = h.status(id);
    EXPECT_EQ(st.state, ConnectionState::Disconnected);
    EXPECT_EQ(st.ledger.failures, 0u);
    EXPECT_THAT(st.lastError, ::testing::HasSubstr("link lost"));

    h.driver.failReadsWith(ErrorKind::None);
    EXPECT_EQ(h.tick(), 1u);
    EXPECT_EQ(h.status(id).state, ConnectionState::Connected);
    EXPECT_EQ(h.driver.count("connect"), 2);
  }

  TEST(scheduler, busy_ring_is_skipped_not_waited_for) {
    RingHarness h;
    const auto id = h.add(kAddr);
    {
      auto held = h.locks.acquire(id);
      EXPECT_EQ(h.tick(), 0u);
    }
    EXPECT_EQ(h.driver.count("connect"), 0);
    EXPECT_EQ(h.tick(), 1u);
  }

  TEST(scheduler, disconnect_requested_while_connecting_applies_on_release) {
    RingHarness h;
    const auto id = h.add(kAddr);
    h.driver.holdConnect();

    ASSERT_EQ(h.scheduler.tick(), 1u);
    ASSERT_TRUE(h.driver.waitUntilConnectParked(2s));
    EXPECT_EQ(h.status(id).state, ConnectionState::Connecting);

    const auto res = h.service.disconnectRing(id);
    EXPECT_TRUE(res.ok);

    h.driver.releaseConnect();
    h.scheduler.waitIdle();

    EXPECT_EQ(h.status(id).state, ConnectionState::Disconnected);
    EXPECT_EQ(h.driver.count("disconnect"), 1);
    EXPECT_EQ(h.driver.count("readBattery"), 0);
  }

  TEST(scheduler, ring_removed_mid_operation_is_purged_after_release) {
    RingHarness h;
    const auto id = h.add(kAddr);
    h.driver.holdConnect();

    ASSERT_EQ(h.scheduler.tick(), 1u);
    ASSERT_TRUE(h.driver.waitUntilConnectParked(2s));

    EXPECT_TRUE(h.service.removeRing(id).ok);
    EXPECT_TRUE(h.registry.list().empty());
    EXPECT_TRUE(h.registry.get(id)); // still draining

    h.driver.releaseConnect();
    h.scheduler.waitIdle();

    EXPECT_FALSE(h.registry.get(id));
    EXPECT_EQ(h.locks.slotCount(), 0u);
    EXPECT_EQ(h.driver.count("readBattery"), 0);
    EXPECT_EQ(h.driver.count("disconnect"), 1);
    EXPECT_EQ(h.tick(), 0u);
  }

  TEST(scheduler, address_stays_taken_until_removed_ring_drains) {
    RingHarness h;
    const auto id = h.add(kAddr);
    h.driver.holdConnect();

    ASSERT_EQ(h.scheduler.tick(), 1u);
    ASSERT_TRUE(h.driver.waitUntilConnectParked(2s));
    ASSERT_TRUE(h.service.removeRing(id).ok);

    const auto again = h.service.registerRing(kAddr);
    EXPECT_FALSE(again.ok);
    EXPECT_EQ(again.error, ErrorKind::DuplicateAddress);
    EXPECT_EQ(h.scheduler.tick(), 0u);

    h.driver.releaseConnect();
    h.scheduler.waitIdle();
    ASSERT_FALSE(h.registry.get(id));

    const auto fresh = h.service.registerRing(kAddr);
    ASSERT_TRUE(fresh.ok);
    h.tick();
    EXPECT_EQ(h.status(*fresh.ringId).state, ConnectionState::Connected);
    EXPECT_LE(h.driver.maxInFlight(kAddr), 1);

    // the old session's release-time disconnect came before the new connect
    const auto calls = h.driver.calls();
    const auto disconnect = std::find(calls.begin(), calls.end(), std::string("disconnect ") + kAddr);
    ASSERT_NE(disconnect, calls.end());
    EXPECT_EQ(std::count(disconnect, calls.end(), std::string("disconnect ") + kAddr), 1);
    EXPECT_EQ(std::count(disconnect, calls.end(), std::string("connect ") + kAddr), 1);
  }

  TEST(scheduler, persistent_mode_serves_previously_connected_rings_first) {
    auto cfg = harnessConfig();
    cfg.workerThreads = 1;
    cfg.syncTimeOnConnect = false;
    RingHarness h(cfg);
    h.add("11:11:11:11:11:11");
    const auto known = h.add("22:22:22:22:22:22");
    RingStatus seen;
    seen.lastSuccess = h.clock.now() - 1h;
    h.registry.updateStatus(known, seen);

    h.tick();
    const auto calls = h.driver.calls();
    ASSERT_FALSE(calls.empty());
    EXPECT_EQ(calls.front(), "connect 22:22:22:22:22:22");
  }

  TEST(scheduler, auto_discovery_registers_matching_rings) {
    auto cfg = harnessConfig();
    cfg.autoDiscover = true;
    RingHarness h(cfg);
    h.driver.advertised = { { "87:89:99:BC:B4:D5", "R02_B4D5", -60 },
                            { "01:02:03:04:05:06", "Headphones", -70 } };

    EXPECT_EQ(h.tick(), 1u);
    auto rings = h.registry.list();
    ASSERT_EQ(rings.size(), 1u);
    EXPECT_EQ(rings[0].name, "R02_B4D5");
    EXPECT_EQ(rings[0].status.state, ConnectionState::Connected);

    h.tick(); // second scan finds nothing new
    EXPECT_EQ(h.registry.list().size(), 1u);
  }

  TEST(scheduler, background_loop_runs_and_stop_drops_links) {
    auto cfg = harnessConfig();
    cfg.scanInterval = 1s;
    RingHarness h(cfg);
    const auto id = h.add(kAddr);

    h.scheduler.start();
    EXPECT_TRUE(h.scheduler.running());
    for (int i = 0; i < 200 && h.status(id).state != ConnectionState::Connected; ++i)
      std::this_thread::sleep_for(10ms);
    ASSERT_EQ(h.status(id).state, ConnectionState::Connected);

    h.scheduler.stop();
    EXPECT_FALSE(h.scheduler.running());
    EXPECT_EQ(h.status(id).state, ConnectionState::Disconnected);
    EXPECT_EQ(h.driver.count("disconnect"), 1);
  }

} // namespace zeddring::test
