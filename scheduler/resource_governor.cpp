#include "scheduler/resource_governor.h"

#include "common/logging/logger.h"
#include "common/metrics/metrics.h"

#include <algorithm>
#include <string>

namespace hiyo {

namespace {
constexpr auto kSecondWindow = std::chrono::seconds(1);
constexpr auto kMinuteWindow = std::chrono::seconds(60);
} // namespace

ResourceGovernor::ResourceGovernor(GovernorConfig config,
                                   std::shared_ptr<const MemoryProbe> probe,
                                   NowFn now)
    : config_(config), probe_(std::move(probe)), now_(std::move(now)) {
  if (!probe_) {
    probe_ = std::make_shared<ProcMemoryProbe>();
  }
  if (!now_) {
    now_ = [] { return Clock::now(); };
  }
}

void ResourceGovernor::PruneLocked(Clock::time_point now) {
  while (!request_times_.empty() &&
         now - request_times_.front() >= kMinuteWindow) {
    request_times_.pop_front();
  }
}

ResourceError ResourceGovernor::CheckMemoryLocked() {
  last_memory_ = probe_->Read();
  if (config_.memory_fraction <= 0.0 || last_memory_.physical_bytes == 0 ||
      last_memory_.resident_bytes == 0) {
    return ResourceError::kNone;
  }
  double limit =
      static_cast<double>(last_memory_.physical_bytes) * config_.memory_fraction;
  if (static_cast<double>(last_memory_.resident_bytes) > limit) {
    return ResourceError::kMemoryPressure;
  }
  return ResourceError::kNone;
}

ResourceError ResourceGovernor::Admit() {
  ResourceError result = ResourceError::kNone;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = now_();
    PruneLocked(now);

    int last_second = 0;
    for (auto it = request_times_.rbegin(); it != request_times_.rend(); ++it) {
      if (now - *it >= kSecondWindow) {
        break;
      }
      ++last_second;
    }

    if (config_.max_requests_per_second > 0 &&
        last_second >= config_.max_requests_per_second) {
      result = ResourceError::kRateLimited;
    } else if (config_.max_requests_per_minute > 0 &&
               static_cast<int>(request_times_.size()) >=
                   config_.max_requests_per_minute) {
      result = ResourceError::kRateLimited;
    } else {
      result = CheckMemoryLocked();
    }

    if (result == ResourceError::kNone) {
      request_times_.push_back(now);
    }
  }

  if (result != ResourceError::kNone) {
    GlobalMetrics().RecordResourceRejection(result);
    log::Warn("governor", "admission rejected",
              std::string("reason=") + ResourceErrorName(result));
  }
  return result;
}

ResourceError ResourceGovernor::Allocate(int n) {
  ResourceError result = ResourceError::kNone;
  int active = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (n <= 0 || n > config_.max_tokens_per_call) {
      result = ResourceError::kInvalidTokenCount;
    } else if (active_tokens_ + n > config_.max_active_tokens) {
      result = ResourceError::kContextTooLarge;
    } else {
      active_tokens_ += n;
    }
    active = active_tokens_;
  }

  if (result != ResourceError::kNone) {
    GlobalMetrics().RecordResourceRejection(result);
    log::Warn("governor", "token allocation rejected",
              "requested=" + std::to_string(n) +
                  " active=" + std::to_string(active) +
                  " reason=" + ResourceErrorName(result));
    return result;
  }
  GlobalMetrics().SetActiveTokens(active);
  return result;
}

void ResourceGovernor::Release(int n) {
  if (n <= 0) {
    return;
  }
  int active = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    active_tokens_ = std::max(0, active_tokens_ - n);
    active = active_tokens_;
  }
  GlobalMetrics().SetActiveTokens(active);
}

int ResourceGovernor::ActiveTokens() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_tokens_;
}

int ResourceGovernor::RecentRequests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = now_();
  return static_cast<int>(std::count_if(
      request_times_.begin(), request_times_.end(),
      [&](Clock::time_point t) { return now - t < kMinuteWindow; }));
}

MemoryReading ResourceGovernor::LastMemoryReading() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_memory_;
}

} // namespace hiyo
