#pragma once
/** @file  RingHarness.hpp
 *  @brief Real core components wired around FakeDeviceDriver + ManualTimeSource.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

#include <chrono>
#include <memory>
#include <string>

#include <gmock/gmock.h>

#include "api/RingService.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/OperationLocks.hpp"
#include "core/RingOperations.hpp"
#include "core/RingRegistry.hpp"
#include "core/Scheduler.hpp"
#include "core/SyncOrchestrator.hpp"
#include "core/TelemetryStore.hpp"
#include "drivers/GuardedDriver.hpp"

#include "FakeDeviceDriver.hpp"
#include "ManualTimeSource.hpp"

namespace zeddring {
  namespace test {

    class MockErrorMonitor : public zeddring::core::ErrorMonitor {
    public:
      MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
      MOCK_METHOD(void, clearFailure, (const std::string&), (override));
    };

    inline zeddring::core::AppConfig harnessConfig() {
      zeddring::core::AppConfig cfg;
      cfg.dataDir = "";
      cfg.workerThreads = 4;
      return cfg;
    }

    /// Memory-only registry and store; everything else is production code.
    struct RingHarness {
      explicit RingHarness(zeddring::core::AppConfig cfg = harnessConfig(),
                           std::chrono::milliseconds guardTimeout = std::chrono::milliseconds(2000))
          : config(std::move(cfg)),
            clock(zeddring::core::Timestamp{ std::chrono::sys_days{
                std::chrono::year{ 2026 } / 6 / 1 } + std::chrono::hours(9) }),
            registry(""),
            guarded(driver, guardTimeout),
            locks(registry, guarded, config.retryPolicy()),
            ops(guarded, registry, store, errors, clock, config.syncTimeOnConnect),
            sync(locks, guarded, store, clock),
            service(registry, locks, ops, sync, store, errors),
            scheduler(registry, locks, ops, errors, config, clock) {}

      zeddring::core::RingId add(const std::string& address) {
        return registry.registerRing(address);
      }

      zeddring::core::RingStatus status(zeddring::core::RingId id) const {
        return registry.get(id)->status;
      }

      /// One synchronous scheduling pass.
      std::size_t tick() {
        const auto n = scheduler.tick();
        scheduler.waitIdle();
        return n;
      }

      zeddring::core::AppConfig config;
      ManualTimeSource clock;
      FakeDeviceDriver driver;
      ::testing::NiceMock<MockErrorMonitor> errors;
      zeddring::core::RingRegistry registry;
      zeddring::core::TelemetryStore store;
      zeddring::drivers::GuardedDriver guarded;
      zeddring::core::OperationLocks locks;
      zeddring::core::RingOperations ops;
      zeddring::core::SyncOrchestrator sync;
      zeddring::api::RingService service;
      zeddring::core::Scheduler scheduler;
    };

  } // namespace test
} // namespace zeddring
