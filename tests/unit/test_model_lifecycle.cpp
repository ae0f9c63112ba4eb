#include <catch2/catch_test_macros.hpp>

#include "scheduler/model_lifecycle.h"

#include "fake_backend.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace hiyo;
using hiyo::testing::FakeBackend;
using hiyo::testing::FakeLoader;

namespace {

class CountingBackend : public FakeBackend {
public:
  std::atomic<int> *clears{nullptr};
  void ClearDeviceCache() override {
    if (clears) {
      (*clears)++;
    }
  }
};

bool WaitFor(const std::atomic<bool> &flag) {
  for (int i = 0; i < 5000 && !flag.load(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return flag.load();
}

} // namespace

// ---------------------------------------------------------------------------
// Successful loads
// ---------------------------------------------------------------------------

TEST_CASE("Lifecycle loads a model and reports monotonic progress",
          "[lifecycle]") {
  auto loader = std::make_shared<FakeLoader>();
  ModelLifecycleManager manager(loader);

  std::vector<LoadState> seen;
  manager.SetStateListener([&](const LoadState &s) { seen.push_back(s); });

  std::vector<double> progress;
  auto result = manager.Load("acme/tiny",
                             [&](double p) { progress.push_back(p); });
  REQUIRE(result.ok());
  REQUIRE(result.kind() == ErrorKind::kNone);

  auto state = manager.CurrentState();
  REQUIRE(state.phase == LoadPhase::kLoaded);
  REQUIRE(state.CurrentModel() == "acme/tiny");
  REQUIRE(manager.IsAvailable());
  REQUIRE(manager.CurrentHandle()->model_id() == "acme/tiny");

  REQUIRE_FALSE(progress.empty());
  for (std::size_t i = 1; i < progress.size(); ++i) {
    REQUIRE(progress[i] >= progress[i - 1]);
  }
  REQUIRE(progress.back() == 1.0);

  REQUIRE(seen.size() >= 2);
  REQUIRE(seen.front().phase == LoadPhase::kLoading);
  REQUIRE(seen.front().model_id == "acme/tiny");
  REQUIRE(seen.back().phase == LoadPhase::kLoaded);
  for (const auto &s : seen) {
    if (s.IsLoading()) {
      REQUIRE(s.LoadingProgress() >= 0.0);
      REQUIRE(s.LoadingProgress() <= 1.0);
    }
  }
}

TEST_CASE("Lifecycle starts idle", "[lifecycle]") {
  ModelLifecycleManager manager(std::make_shared<FakeLoader>());
  auto state = manager.CurrentState();
  REQUIRE(state.phase == LoadPhase::kIdle);
  REQUIRE(state.CurrentModel() == "None");
  REQUIRE_FALSE(state.IsLoading());
  REQUIRE(state.LoadingProgress() == 0.0);
  REQUIRE_FALSE(manager.IsAvailable());
}

// ---------------------------------------------------------------------------
// Failures
// ---------------------------------------------------------------------------

TEST_CASE("Lifecycle rejects an invalid id without a state change",
          "[lifecycle]") {
  auto loader = std::make_shared<FakeLoader>();
  ModelLifecycleManager manager(loader);
  int notifications = 0;
  manager.SetStateListener([&](const LoadState &) { ++notifications; });

  auto result = manager.Load("../etc/passwd");
  REQUIRE_FALSE(result.ok());
  REQUIRE(result.code == LoadErrorCode::kInvalidIdentifier);
  REQUIRE(result.kind() == ErrorKind::kValidation);
  REQUIRE(manager.CurrentState().phase == LoadPhase::kIdle);
  REQUIRE(notifications == 0);
  REQUIRE(loader->calls.load() == 0);
}

TEST_CASE("Lifecycle keeps the previous model when a reload fails",
          "[lifecycle]") {
  auto loader = std::make_shared<FakeLoader>();
  loader->failures["acme/broken"] = LoadErrorCode::kModelNotFound;
  ModelLifecycleManager manager(loader);

  REQUIRE(manager.Load("acme/good").ok());
  auto good = manager.CurrentHandle();

  auto result = manager.Load("acme/broken");
  REQUIRE(result.outcome == LoadResult::Outcome::kFailed);
  REQUIRE(result.kind() == ErrorKind::kLoad);

  auto state = manager.CurrentState();
  REQUIRE(state.phase == LoadPhase::kFailed);
  REQUIRE(state.model_id == "acme/broken");
  REQUIRE(state.error == LoadErrorCode::kModelNotFound);
  REQUIRE_FALSE(state.error_message.empty());
  REQUIRE(manager.CurrentHandle() == good);

  // Failed -> Loading -> Loaded.
  REQUIRE(manager.Load("acme/good").ok());
  REQUIRE(manager.CurrentState().phase == LoadPhase::kLoaded);
}

// ---------------------------------------------------------------------------
// Concurrency
// ---------------------------------------------------------------------------

TEST_CASE("Lifecycle supersedes an in-flight load", "[lifecycle]") {
  auto loader = std::make_shared<FakeLoader>();
  loader->block_until_cancelled["acme/slow"] = true;
  ModelLifecycleManager manager(loader);

  LoadResult first;
  std::thread t([&] { first = manager.Load("acme/slow"); });
  REQUIRE(WaitFor(loader->blocked));

  auto second = manager.Load("acme/fast");
  t.join();

  REQUIRE(first.outcome == LoadResult::Outcome::kSuperseded);
  REQUIRE(first.kind() == ErrorKind::kNone);
  REQUIRE(second.ok());
  auto state = manager.CurrentState();
  REQUIRE(state.phase == LoadPhase::kLoaded);
  REQUIRE(state.model_id == "acme/fast");
  REQUIRE(manager.CurrentHandle()->model_id() == "acme/fast");
}

TEST_CASE("Unload cancels an in-flight load", "[lifecycle]") {
  auto loader = std::make_shared<FakeLoader>();
  loader->block_until_cancelled["acme/slow"] = true;
  ModelLifecycleManager manager(loader);

  LoadResult result;
  std::thread t([&] { result = manager.Load("acme/slow"); });
  REQUIRE(WaitFor(loader->blocked));
  manager.Unload();
  t.join();

  REQUIRE(result.outcome == LoadResult::Outcome::kSuperseded);
  REQUIRE(manager.CurrentState().phase == LoadPhase::kIdle);
  REQUIRE_FALSE(manager.IsAvailable());
}

// ---------------------------------------------------------------------------
// Unload and handle lifetime
// ---------------------------------------------------------------------------

TEST_CASE("Unload releases the model and clears the device cache",
          "[lifecycle]") {
  std::atomic<bool> destroyed{false};
  std::atomic<int> clears{0};
  auto loader = std::make_shared<FakeLoader>();
  loader->make_backend = [&](const std::string &) {
    auto b = std::make_unique<CountingBackend>();
    b->destroyed = &destroyed;
    b->clears = &clears;
    return b;
  };
  ModelLifecycleManager manager(loader);
  REQUIRE(manager.Load("acme/tiny").ok());

  manager.Unload();
  REQUIRE(manager.CurrentState().phase == LoadPhase::kIdle);
  REQUIRE(manager.CurrentState().CurrentModel() == "None");
  REQUIRE(destroyed.load());
  REQUIRE(clears.load() == 1);

  // Unloading twice is harmless.
  manager.Unload();
  REQUIRE(clears.load() == 1);
}

TEST_CASE("A leased handle outlives Unload", "[lifecycle]") {
  std::atomic<bool> destroyed{false};
  auto loader = std::make_shared<FakeLoader>();
  loader->make_backend = [&](const std::string &) {
    auto b = std::make_unique<FakeBackend>();
    b->destroyed = &destroyed;
    return b;
  };
  ModelLifecycleManager manager(loader);
  REQUIRE(manager.Load("acme/tiny").ok());

  auto lease = ModelHandle::TryLease(manager.CurrentHandle());
  REQUIRE(lease.valid());
  manager.Unload();
  REQUIRE_FALSE(destroyed.load());
  REQUIRE(lease.handle()->model_id() == "acme/tiny");

  lease.Release();
  REQUIRE(destroyed.load());
}

TEST_CASE("ModelHandle grants a single decode lease", "[lifecycle]") {
  auto handle = std::make_shared<ModelHandle>("acme/tiny",
                                              std::make_unique<FakeBackend>());
  auto first = ModelHandle::TryLease(handle);
  REQUIRE(first.valid());
  REQUIRE(handle->InUse());
  REQUIRE_FALSE(ModelHandle::TryLease(handle).valid());

  DecodeLease moved = std::move(first);
  REQUIRE(moved.valid());
  REQUIRE_FALSE(first.valid());
  REQUIRE(handle->InUse());

  moved.Release();
  REQUIRE_FALSE(handle->InUse());
  REQUIRE(ModelHandle::TryLease(handle).valid());
  REQUIRE_FALSE(ModelHandle::TryLease(nullptr).valid());
}

TEST_CASE("LoadState describes itself", "[lifecycle]") {
  LoadState s;
  REQUIRE(s.Describe() == "idle");
  s.phase = LoadPhase::kLoading;
  s.model_id = "acme/tiny";
  s.progress = 0.4;
  REQUIRE(s.Describe() == "loading acme/tiny 40%");
  s.phase = LoadPhase::kFailed;
  s.error = LoadErrorCode::kLoadFailed;
  s.error_message = "bad weights";
  REQUIRE(s.Describe().find("bad weights") != std::string::npos);
  REQUIRE(s.CurrentModel() == "None");
}
