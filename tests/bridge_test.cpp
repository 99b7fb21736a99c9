// Zeddring-Prod headers
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"
#include "core/TimeSource.hpp"
#include "drivers/BridgeDriver.hpp"
#include "drivers/DriverFactory.hpp"
#include "drivers/SimulatedDriver.hpp"
#include "protocols/BridgeResponse.hpp"

// Zeddring-Fake headers
#include "FakeSerialChannel.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <sstream>

namespace zeddring::test {

  using namespace std::chrono_literals;
  using zeddring::core::ErrorKind;
  using zeddring::core::TransportError;
  using zeddring::drivers::BridgeDriver;
  using zeddring::protocols::BridgeResponse;

  constexpr const char* kAddr = "AA:BB:CC:DD:EE:FF";

  /// Split "<tag> VERB args\r\n" into tag and the rest.
  inline std::pair<std::string, std::string> splitRequest(const std::string& line) {
    std::istringstream in(line);
    std::string tag, verb;
    in >> tag >> verb;
    return { tag, verb };
  }

  class BridgeDriverTest : public ::testing::Test {
  protected:
    void SetUp() override {
      auto fake = std::make_unique<FakeSerialChannel>();
      channel = fake.get(); // raw ptr for assertions
      driver = std::make_unique<BridgeDriver>(std::move(fake), "/dev/fake");
      driver->start();
    }

    /// Answer every request with \p lines, each prefixed by the request's tag.
    void answer(std::vector<std::string> lines) {
      channel->responder = [lines](const std::string& req, std::deque<std::string>& out) {
        const auto tag = splitRequest(req).first;
        for (const auto& l : lines)
          out.push_back(tag + " " + l);
      };
    }

    FakeSerialChannel* channel{ nullptr };
    std::unique_ptr<BridgeDriver> driver;
  };

  TEST(bridge_response, parses_tagged_lines) {
    auto ok = BridgeResponse::fromWire("12 OK 87\r");
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok->tag, 12u);
    EXPECT_EQ(ok->kind, BridgeResponse::Kind::Ok);
    EXPECT_EQ(ok->payload, "87");

    auto err = BridgeResponse::fromWire("3 ERR ring out of range");
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind, BridgeResponse::Kind::Err);
    EXPECT_EQ(err->payload, "ring out of range");

    auto rec = BridgeResponse::fromWire("4 D AA:BB:CC:DD:EE:FF -70 R02_EEFF");
    ASSERT_TRUE(rec);
    EXPECT_EQ(rec->kind, BridgeResponse::Kind::Record);
    EXPECT_EQ(rec->code, "D");

    EXPECT_FALSE(BridgeResponse::fromWire(""));
    EXPECT_FALSE(BridgeResponse::fromWire("OK 87"));
    EXPECT_FALSE(BridgeResponse::fromWire("7 MAYBE"));
    EXPECT_FALSE(BridgeResponse::fromWire("x7 OK"));
  }

  TEST_F(BridgeDriverTest, start_opens_the_device_once) {
    EXPECT_TRUE(channel->open_called);
    EXPECT_NO_THROW(driver->start());
  }

  TEST(bridge_driver, open_failure_throws) {
    auto fake = std::make_unique<FakeSerialChannel>();
    fake->open_result = false;
    BridgeDriver driver(std::move(fake), "/dev/missing");
    EXPECT_THROW(driver.start(), std::runtime_error);
    EXPECT_THROW(BridgeDriver(nullptr, "/dev/x"), std::invalid_argument);
  }

  TEST_F(BridgeDriverTest, read_battery_writes_tagged_request_and_parses_reply) {
    answer({ "OK 87" });
    EXPECT_EQ(driver->readBattery(kAddr, 100ms), 87);
    EXPECT_EQ(channel->getLastWritten(), std::string("1 BATTERY ") + kAddr + "\r\n");

    EXPECT_EQ(driver->readHeartRate(kAddr, 100ms), 87);
    EXPECT_EQ(channel->getLastWritten(), std::string("2 HR ") + kAddr + "\r\n");
  }

  TEST_F(BridgeDriverTest, err_reply_is_transport_failure) {
    answer({ "ERR ring not found" });
    try {
      driver->connect(kAddr, 100ms);
      FAIL() << "expected TransportError";
    } catch (const TransportError& ex) {
      EXPECT_EQ(ex.kind(), ErrorKind::TransportFailure);
    }
  }

  TEST_F(BridgeDriverTest, silence_is_timeout_and_stale_tag_is_dropped) {
    try {
      driver->readSteps(kAddr, 30ms);
      FAIL() << "expected TransportError";
    } catch (const TransportError& ex) {
      EXPECT_EQ(ex.kind(), ErrorKind::TransportTimeout);
    }

    // the late answer to request 1 arrives ahead of the answer to request 2
    channel->responder = [](const std::string& req, std::deque<std::string>& out) {
      out.push_back("1 OK 999");
      out.push_back(splitRequest(req).first + " OK 4321");
    };
    EXPECT_EQ(driver->readSteps(kAddr, 100ms), 4321);
  }

  TEST_F(BridgeDriverTest, non_numeric_payload_is_malformed) {
    answer({ "OK lots" });
    EXPECT_THROW(driver->readSteps(kAddr, 100ms), TransportError);
  }

  TEST_F(BridgeDriverTest, history_collects_counted_records) {
    answer({ "OK 3", "S 1780000000000 120", "H 1780000000000 64", "H 1780001800000 70" });
    const auto history = driver->readHistory(kAddr, 100ms);
    ASSERT_EQ(history.steps.size(), 1u);
    EXPECT_EQ(history.steps[0].value, 120);
    EXPECT_EQ(history.steps[0].timestamp, core::fromEpochMillis(1780000000000));
    ASSERT_EQ(history.heartRate.size(), 2u);
    EXPECT_EQ(history.heartRate[1].value, 70);
  }

  TEST_F(BridgeDriverTest, history_short_of_records_times_out) {
    answer({ "OK 2", "S 1780000000000 120" });
    EXPECT_THROW(driver->readHistory(kAddr, 30ms), TransportError);
  }

  TEST_F(BridgeDriverTest, scan_asks_for_a_shorter_window_and_parses_names) {
    answer({ "OK 2", "D AA:BB:CC:DD:EE:01 -61 R02_EE01", "D AA:BB:CC:DD:EE:02 -80 Some Watch" });
    const auto found = driver->scan(1000ms);
    EXPECT_EQ(channel->getLastWritten(), "1 SCAN 800\r\n");
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].name, "R02_EE01");
    EXPECT_EQ(found[0].rssi, -61);
    EXPECT_EQ(found[1].name, "Some Watch");
  }

  TEST_F(BridgeDriverTest, set_time_sends_epoch_seconds) {
    answer({ "OK" });
    driver->setTime(kAddr, core::fromEpochMillis(1780000000500), 100ms);
    EXPECT_EQ(channel->getLastWritten(), std::string("1 SETTIME ") + kAddr + " 1780000000\r\n");
  }

  TEST_F(BridgeDriverTest, closed_channel_fails_fast) {
    channel->is_open = false;
    EXPECT_THROW(driver->reboot(kAddr, 100ms), TransportError);
    EXPECT_TRUE(channel->written.empty());
  }

  //---SimulatedDriver--------------------------------------------------------
  TEST(simulated_driver, reads_need_a_connection) {
    drivers::SimulatedDriver sim({}, 7);
    EXPECT_THROW(sim.readBattery(kAddr, 10ms), TransportError);

    ASSERT_TRUE(sim.connect(kAddr, 10ms));
    EXPECT_TRUE(sim.isConnected(kAddr));
    const int battery = sim.readBattery(kAddr, 10ms);
    EXPECT_GE(battery, 5);
    EXPECT_LE(battery, 100);

    const int first = sim.readSteps(kAddr, 10ms);
    EXPECT_GE(sim.readSteps(kAddr, 10ms), first);

    const auto history = sim.readHistory(kAddr, 10ms);
    EXPECT_EQ(history.steps.size(), 24u);
    EXPECT_EQ(history.heartRate.size(), 48u);

    ASSERT_TRUE(sim.reboot(kAddr, 10ms));
    EXPECT_FALSE(sim.isConnected(kAddr));
  }

  TEST(simulated_driver, scan_returns_advertised_rings) {
    drivers::SimulatedDriver sim;
    const auto found = sim.scan(10ms);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].name, "R02_B4D5");
  }

  TEST(simulated_driver, failure_rate_one_always_fails) {
    drivers::SimulatedDriver sim({}, 7, 1.0);
    EXPECT_THROW(sim.connect(kAddr, 10ms), TransportError);
  }

  //---DriverFactory----------------------------------------------------------
  TEST(driver_factory, builtins_and_unknown_names) {
    auto factory = drivers::DriverFactory::withBuiltins();
    core::AppConfig cfg;
    EXPECT_NE(factory.create("simulated", cfg), nullptr);
    EXPECT_THROW(factory.create("carrier-pigeon", cfg), std::out_of_range);

    cfg.bridgeDevice = "/nonexistent/ttyACM9";
    EXPECT_THROW(factory.create("bridge", cfg), std::runtime_error);

    EXPECT_FALSE(factory.registerDriver("simulated", nullptr));
  }

} // namespace zeddring::test
