/* @file BridgeDriver.cpp
 * @brief tagged request/reply exchange with the BLE bridge dongle
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <charconv>
#include <sstream>
#include <stdexcept>
#include <utility>

// Third-party headers
#include <spdlog/spdlog.h>

// Zeddring headers
#include "core/Errors.hpp"
#include "core/TimeSource.hpp"
#include "drivers/BridgeDriver.hpp"

using namespace zeddring::drivers;
using zeddring::core::ErrorKind;
using zeddring::core::TransportError;
using zeddring::protocols::BridgeCommand;
using zeddring::protocols::BridgeResponse;

namespace {

  [[noreturn]] void malformed(const std::string& what) {
    throw TransportError(ErrorKind::TransportFailure, "[Bridge] malformed reply: " + what);
  }

  template <typename T> T parseNumber(const std::string& text) {
    T value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
      malformed("'" + text + "' is not a number");
    return value;
  }

  HistoryRecord parseHistory(const std::string& payload) {
    std::istringstream in(payload);
    std::string ms, value;
    if (!(in >> ms >> value))
      malformed("history record '" + payload + "'");
    return HistoryRecord{ zeddring::core::fromEpochMillis(parseNumber<std::int64_t>(ms)),
                          parseNumber<std::int64_t>(value) };
  }

  DiscoveredRing parseDiscovery(const std::string& payload) {
    std::istringstream in(payload);
    std::string address, rssi;
    if (!(in >> address >> rssi))
      malformed("scan record '" + payload + "'");
    std::string name;
    std::getline(in >> std::ws, name);
    return DiscoveredRing{ address, name, parseNumber<int>(rssi) };
  }

} // namespace

BridgeDriver::BridgeDriver(std::unique_ptr<io::SerialChannel> channel, std::string device,
                           speed_t baud)
    : channel_(std::move(channel)), device_(std::move(device)), baud_(baud) {
  if (!channel_)
    throw std::invalid_argument("[Bridge] serial channel is nullptr");
}

void BridgeDriver::start() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (channel_->isOpen())
    return;
  if (!channel_->open(device_, baud_))
    throw std::runtime_error("[Bridge] serial device " + device_ + " open failed");
  spdlog::info("[Bridge] using {}", device_);
}

BridgeDriver::Reply BridgeDriver::transact(const std::string& verb, std::vector<std::string> args,
                                           std::chrono::milliseconds timeout, bool multiline) {
  std::lock_guard<std::mutex> lock(mtx_);
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  if (!channel_->isOpen())
    throw TransportError(ErrorKind::TransportFailure, "[Bridge] " + device_ + " is not open");

  const BridgeCommand cmd{ ++nextTag_, verb, std::move(args) };
  if (!channel_->writeLine(cmd.toWire()))
    throw TransportError(ErrorKind::TransportFailure, "[Bridge] write to " + device_ + " failed");

  Reply reply;
  std::size_t expected = 0;
  bool gotHeader = false;

  for (;;) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0)
      throw TransportError(ErrorKind::TransportTimeout,
                           "[Bridge] no reply to " + verb + " within " +
                               std::to_string(timeout.count()) + " ms");

    auto line = channel_->readLine(left);
    if (!line) {
      if (!channel_->isOpen())
        throw TransportError(ErrorKind::TransportFailure, "[Bridge] " + device_ + " closed");
      continue; // loop re-checks the deadline
    }

    auto resp = BridgeResponse::fromWire(*line);
    if (!resp) {
      spdlog::warn("[Bridge] unparseable line '{}' ignored", *line);
      continue;
    }
    if (resp->tag != cmd.tag) {
      spdlog::debug("[Bridge] stale reply for tag {} dropped", resp->tag);
      continue;
    }

    switch (resp->kind) {
    case BridgeResponse::Kind::Err:
      throw TransportError(ErrorKind::TransportFailure, "[Bridge] " + verb + ": " + resp->payload);
    case BridgeResponse::Kind::Ok:
      reply.payload = resp->payload;
      if (!multiline)
        return reply;
      expected = parseNumber<std::size_t>(resp->payload);
      gotHeader = true;
      break;
    case BridgeResponse::Kind::Record:
      if (!gotHeader)
        malformed("record before OK");
      reply.records.push_back(std::move(*resp));
      break;
    }

    if (gotHeader && reply.records.size() == expected)
      return reply;
  }
}

int BridgeDriver::readInt(const std::string& verb, const std::string& address,
                          std::chrono::milliseconds timeout) {
  return parseNumber<int>(transact(verb, { address }, timeout).payload);
}

bool BridgeDriver::connect(const std::string& address, std::chrono::milliseconds timeout) {
  transact("CONNECT", { address }, timeout);
  return true;
}

bool BridgeDriver::disconnect(const std::string& address, std::chrono::milliseconds timeout) {
  transact("DISCONNECT", { address }, timeout);
  return true;
}

int BridgeDriver::readBattery(const std::string& address, std::chrono::milliseconds timeout) {
  return readInt("BATTERY", address, timeout);
}

int BridgeDriver::readSteps(const std::string& address, std::chrono::milliseconds timeout) {
  return readInt("STEPS", address, timeout);
}

int BridgeDriver::readHeartRate(const std::string& address, std::chrono::milliseconds timeout) {
  return readInt("HR", address, timeout);
}

RingHistory BridgeDriver::readHistory(const std::string& address,
                                      std::chrono::milliseconds timeout) {
  RingHistory history;
  for (const auto& rec : transact("HISTORY", { address }, timeout, true).records) {
    if (rec.code == "S")
      history.steps.push_back(parseHistory(rec.payload));
    else if (rec.code == "H")
      history.heartRate.push_back(parseHistory(rec.payload));
    else
      malformed("unexpected " + rec.code + " record in HISTORY");
  }
  return history;
}

bool BridgeDriver::setTime(const std::string& address, core::Timestamp when,
                           std::chrono::milliseconds timeout) {
  const auto secs =
      std::chrono::duration_cast<std::chrono::seconds>(when.time_since_epoch()).count();
  transact("SETTIME", { address, std::to_string(secs) }, timeout);
  return true;
}

bool BridgeDriver::reboot(const std::string& address, std::chrono::milliseconds timeout) {
  transact("REBOOT", { address }, timeout);
  return true;
}

std::vector<DiscoveredRing> BridgeDriver::scan(std::chrono::milliseconds timeout) {
  // leave the dongle room to answer inside our own budget
  const auto window = timeout * 4 / 5;
  std::vector<DiscoveredRing> found;
  for (const auto& rec :
       transact("SCAN", { std::to_string(window.count()) }, timeout, true).records) {
    if (rec.code != "D")
      malformed("unexpected " + rec.code + " record in SCAN");
    found.push_back(parseDiscovery(rec.payload));
  }
  return found;
}
