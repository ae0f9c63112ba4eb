#pragma once

#include "common/errors.h"

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace hiyo {

// Latency histogram with fixed buckets (in milliseconds).
// Cumulative counts per bucket + sum + count.
struct LatencyHistogram {
  // Upper bounds in milliseconds: 50, 250, 1000, 2500, 5000, 10000, 30000,
  // 60000, +Inf. Generation and model loads both run in seconds, not ms.
  static constexpr std::array<double, 8> kBuckets{
      50.0, 250.0, 1000.0, 2500.0, 5000.0, 10000.0, 30000.0, 60000.0};
  std::array<std::atomic<uint64_t>, 9> counts{}; // 8 finite + 1 +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

// Process-wide engine counters. All methods are thread-safe.
class MetricsRegistry {
public:
  void RecordGenerationStarted();
  void RecordGenerationFinished(int prompt_tokens, int completion_tokens,
                                double elapsed_ms);
  void RecordGenerationCancelled(int prompt_tokens, int completion_tokens);
  void RecordGenerationFailed();
  void RecordResourceRejection(ResourceError error);
  void RecordPromptTruncated(int dropped_tokens);

  void RecordModelLoad(const std::string &model_id, double load_ms);
  void RecordModelLoadFailure(const std::string &model_id);
  void RecordModelUnload();

  // Gauge mirrored from the Resource Governor after every mutation.
  void SetActiveTokens(int tokens);

  struct Snapshot {
    uint64_t generations_started{0};
    uint64_t generations_completed{0};
    uint64_t generations_cancelled{0};
    uint64_t generations_failed{0};
    uint64_t prompt_tokens{0};
    uint64_t completion_tokens{0};
    uint64_t truncated_prompts{0};
    uint64_t model_loads{0};
    uint64_t model_load_failures{0};
    uint64_t model_unloads{0};
    int active_tokens{0};
  };
  Snapshot Take() const;

  uint64_t ResourceRejections(ResourceError error) const;

  // Human-readable multi-line dump ("name value" per line).
  std::string RenderText() const;

  // Zero every counter. Used by tests.
  void Reset();

private:
  std::atomic<uint64_t> generations_started_{0};
  std::atomic<uint64_t> generations_completed_{0};
  std::atomic<uint64_t> generations_cancelled_{0};
  std::atomic<uint64_t> generations_failed_{0};
  std::atomic<uint64_t> prompt_tokens_{0};
  std::atomic<uint64_t> completion_tokens_{0};
  std::atomic<uint64_t> truncated_prompts_{0};
  std::atomic<uint64_t> truncated_tokens_{0};
  std::atomic<uint64_t> model_loads_{0};
  std::atomic<uint64_t> model_load_failures_{0};
  std::atomic<uint64_t> model_unloads_{0};
  std::atomic<int> active_tokens_{0};

  LatencyHistogram generation_latency_;
  LatencyHistogram load_latency_;

  mutable std::mutex rejection_mutex_;
  std::unordered_map<int, uint64_t> rejections_;

  mutable std::mutex model_mutex_;
  std::string last_model_id_;
  std::string last_failed_model_id_;
};

MetricsRegistry &GlobalMetrics();

} // namespace hiyo
