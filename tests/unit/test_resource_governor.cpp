#include <catch2/catch_test_macros.hpp>

#include "scheduler/resource_governor.h"

#include "fake_backend.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace hiyo;
using hiyo::testing::FakeClock;
using hiyo::testing::FakeMemoryProbe;
using std::chrono::milliseconds;

namespace {

std::shared_ptr<FakeMemoryProbe> RoomyProbe() {
  auto probe = std::make_shared<FakeMemoryProbe>();
  probe->Set(1ull << 30, 16ull << 30); // 1 GiB of 16 GiB.
  return probe;
}

} // namespace

// ---------------------------------------------------------------------------
// Rate limiting
// ---------------------------------------------------------------------------

TEST_CASE("Governor rejects the 11th request within one second",
          "[governor]") {
  FakeClock clock;
  ResourceGovernor governor({}, RoomyProbe(), clock.Fn());

  for (int i = 0; i < 10; ++i) {
    REQUIRE(governor.Admit() == ResourceError::kNone);
    clock.Advance(milliseconds(90)); // 10 requests within 900 ms
  }
  REQUIRE(governor.Admit() == ResourceError::kRateLimited);
  REQUIRE(governor.RecentRequests() == 10);
}

TEST_CASE("Governor per-second window slides", "[governor]") {
  FakeClock clock;
  ResourceGovernor governor({}, RoomyProbe(), clock.Fn());

  for (int i = 0; i < 10; ++i) {
    REQUIRE(governor.Admit() == ResourceError::kNone);
  }
  REQUIRE(governor.Admit() == ResourceError::kRateLimited);
  clock.Advance(milliseconds(1000));
  REQUIRE(governor.Admit() == ResourceError::kNone);
}

TEST_CASE("Governor enforces the per-minute limit", "[governor]") {
  FakeClock clock;
  ResourceGovernor governor({}, RoomyProbe(), clock.Fn());

  // 60 requests spread so the per-second limit never triggers.
  for (int i = 0; i < 60; ++i) {
    REQUIRE(governor.Admit() == ResourceError::kNone);
    clock.Advance(milliseconds(500));
  }
  // 30 s elapsed: all 60 are still inside the trailing minute.
  REQUIRE(governor.Admit() == ResourceError::kRateLimited);

  // Once the oldest request ages past 60 s there is room again.
  clock.Advance(milliseconds(30000));
  REQUIRE(governor.Admit() == ResourceError::kNone);
}

TEST_CASE("Governor rejected requests do not consume rate budget",
          "[governor]") {
  FakeClock clock;
  GovernorConfig cfg;
  cfg.max_requests_per_second = 2;
  ResourceGovernor governor(cfg, RoomyProbe(), clock.Fn());

  REQUIRE(governor.Admit() == ResourceError::kNone);
  REQUIRE(governor.Admit() == ResourceError::kNone);
  for (int i = 0; i < 5; ++i) {
    REQUIRE(governor.Admit() == ResourceError::kRateLimited);
  }
  REQUIRE(governor.RecentRequests() == 2);
}

// ---------------------------------------------------------------------------
// Memory pressure
// ---------------------------------------------------------------------------

TEST_CASE("Governor rejects under memory pressure", "[governor]") {
  FakeClock clock;
  auto probe = std::make_shared<FakeMemoryProbe>();
  probe->Set(90, 100); // 90% resident, limit is 80%.
  ResourceGovernor governor({}, probe, clock.Fn());

  REQUIRE(governor.Admit() == ResourceError::kMemoryPressure);
  REQUIRE(governor.LastMemoryReading().resident_bytes == 90);
  REQUIRE(governor.RecentRequests() == 0);

  probe->Set(50, 100);
  REQUIRE(governor.Admit() == ResourceError::kNone);
}

TEST_CASE("Governor passes when memory cannot be read", "[governor]") {
  FakeClock clock;
  auto probe = std::make_shared<FakeMemoryProbe>(); // all zeros
  ResourceGovernor governor({}, probe, clock.Fn());
  REQUIRE(governor.Admit() == ResourceError::kNone);
}

TEST_CASE("Governor rate limit is checked before memory", "[governor]") {
  FakeClock clock;
  auto probe = std::make_shared<FakeMemoryProbe>();
  GovernorConfig cfg;
  cfg.max_requests_per_second = 1;
  ResourceGovernor governor(cfg, probe, clock.Fn());
  REQUIRE(governor.Admit() == ResourceError::kNone);
  probe->Set(99, 100);
  REQUIRE(governor.Admit() == ResourceError::kRateLimited);
}

// ---------------------------------------------------------------------------
// Token budget
// ---------------------------------------------------------------------------

TEST_CASE("Governor Allocate validates the per-call count", "[governor]") {
  ResourceGovernor governor({}, RoomyProbe());
  REQUIRE(governor.Allocate(0) == ResourceError::kInvalidTokenCount);
  REQUIRE(governor.Allocate(-3) == ResourceError::kInvalidTokenCount);
  REQUIRE(governor.Allocate(8193) == ResourceError::kInvalidTokenCount);
  REQUIRE(governor.ActiveTokens() == 0);
  REQUIRE(governor.Allocate(8192) == ResourceError::kNone);
  REQUIRE(governor.ActiveTokens() == 8192);
}

TEST_CASE("Governor Allocate enforces the global ceiling", "[governor]") {
  ResourceGovernor governor({}, RoomyProbe());
  REQUIRE(governor.Allocate(8000) == ResourceError::kNone);
  REQUIRE(governor.Allocate(2001) == ResourceError::kContextTooLarge);
  REQUIRE(governor.ActiveTokens() == 8000);
  REQUIRE(governor.Allocate(2000) == ResourceError::kNone);
  REQUIRE(governor.ActiveTokens() == 10000);
  REQUIRE(governor.Allocate(1) == ResourceError::kContextTooLarge);
}

TEST_CASE("Governor Release clamps at zero", "[governor]") {
  ResourceGovernor governor({}, RoomyProbe());
  REQUIRE(governor.Allocate(10) == ResourceError::kNone);
  governor.Release(4);
  REQUIRE(governor.ActiveTokens() == 6);
  governor.Release(100);
  REQUIRE(governor.ActiveTokens() == 0);
  governor.Release(5);
  REQUIRE(governor.ActiveTokens() == 0);
}

TEST_CASE("Governor ledger stays consistent under concurrent use",
          "[governor]") {
  ResourceGovernor governor({}, RoomyProbe());
  std::atomic<bool> over_ceiling{false};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 500; ++i) {
        if (governor.Allocate(3) == ResourceError::kNone) {
          if (governor.ActiveTokens() > 10000) {
            over_ceiling = true;
          }
          governor.Release(3);
        }
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  REQUIRE_FALSE(over_ceiling.load());
  REQUIRE(governor.ActiveTokens() == 0);
}
