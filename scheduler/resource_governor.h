#pragma once

#include "common/errors.h"
#include "scheduler/memory_probe.h"

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>

namespace hiyo {

struct GovernorConfig {
  int max_requests_per_second{10};
  int max_requests_per_minute{60};
  // Admission is refused while resident memory exceeds this share of
  // physical memory. <= 0 disables the check.
  double memory_fraction{0.8};
  int max_tokens_per_call{8192};
  int max_active_tokens{10000};
};

// ResourceGovernor gates generation requests on request rate and memory
// pressure and keeps the global token budget.
//
//   governor.Admit();              // once per request, before any tokens
//   governor.Allocate(prompt);     // reserve prompt tokens
//   governor.Allocate(1);          // once per generated token
//   governor.Release(prompt + n);  // exactly once, on every exit path
//
// Thread safety: all public methods are thread-safe; Admit/Allocate/Release
// are the only mutation entry points.
class ResourceGovernor {
public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  explicit ResourceGovernor(GovernorConfig config = {},
                            std::shared_ptr<const MemoryProbe> probe = nullptr,
                            NowFn now = nullptr);

  // Rate limits first, then memory pressure. The request is recorded in the
  // rate window only when admitted.
  ResourceError Admit();

  // Reserve budget for n tokens. Nothing is reserved on rejection.
  ResourceError Allocate(int n);

  // Return budget. Clamps at zero so a double release on an error path can
  // never drive the ledger negative.
  void Release(int n);

  int ActiveTokens() const;

  // Requests admitted in the trailing minute (for diagnostics).
  int RecentRequests() const;

  // Last memory reading taken by Admit().
  MemoryReading LastMemoryReading() const;

private:
  void PruneLocked(Clock::time_point now);
  ResourceError CheckMemoryLocked();

  const GovernorConfig config_;
  std::shared_ptr<const MemoryProbe> probe_;
  NowFn now_;

  mutable std::mutex mutex_;
  int active_tokens_{0};
  std::deque<Clock::time_point> request_times_; // oldest first
  MemoryReading last_memory_{};
};

} // namespace hiyo
