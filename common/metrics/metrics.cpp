#include "common/metrics/metrics.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace hiyo {

namespace {
MetricsRegistry g_metrics;
} // namespace

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)),
                   std::memory_order_relaxed);
  // All buckets are cumulative: increment every bucket >= ms.
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordGenerationStarted() {
  generations_started_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordGenerationFinished(int prompt_tokens,
                                               int completion_tokens,
                                               double elapsed_ms) {
  generations_completed_.fetch_add(1, std::memory_order_relaxed);
  prompt_tokens_.fetch_add(static_cast<uint64_t>(std::max(0, prompt_tokens)),
                           std::memory_order_relaxed);
  completion_tokens_.fetch_add(
      static_cast<uint64_t>(std::max(0, completion_tokens)),
      std::memory_order_relaxed);
  generation_latency_.Record(elapsed_ms);
}

void MetricsRegistry::RecordGenerationCancelled(int prompt_tokens,
                                                int completion_tokens) {
  generations_cancelled_.fetch_add(1, std::memory_order_relaxed);
  prompt_tokens_.fetch_add(static_cast<uint64_t>(std::max(0, prompt_tokens)),
                           std::memory_order_relaxed);
  completion_tokens_.fetch_add(
      static_cast<uint64_t>(std::max(0, completion_tokens)),
      std::memory_order_relaxed);
}

void MetricsRegistry::RecordGenerationFailed() {
  generations_failed_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordResourceRejection(ResourceError error) {
  if (error == ResourceError::kNone) {
    return;
  }
  std::lock_guard<std::mutex> lock(rejection_mutex_);
  rejections_[static_cast<int>(error)]++;
}

void MetricsRegistry::RecordPromptTruncated(int dropped_tokens) {
  truncated_prompts_.fetch_add(1, std::memory_order_relaxed);
  if (dropped_tokens > 0) {
    truncated_tokens_.fetch_add(static_cast<uint64_t>(dropped_tokens),
                                std::memory_order_relaxed);
  }
}

void MetricsRegistry::RecordModelLoad(const std::string &model_id,
                                      double load_ms) {
  model_loads_.fetch_add(1, std::memory_order_relaxed);
  load_latency_.Record(load_ms);
  std::lock_guard<std::mutex> lock(model_mutex_);
  last_model_id_ = model_id;
}

void MetricsRegistry::RecordModelLoadFailure(const std::string &model_id) {
  model_load_failures_.fetch_add(1, std::memory_order_relaxed);
  std::lock_guard<std::mutex> lock(model_mutex_);
  last_failed_model_id_ = model_id;
}

void MetricsRegistry::RecordModelUnload() {
  model_unloads_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::SetActiveTokens(int tokens) {
  active_tokens_.store(tokens, std::memory_order_relaxed);
}

MetricsRegistry::Snapshot MetricsRegistry::Take() const {
  Snapshot s;
  s.generations_started = generations_started_.load(std::memory_order_relaxed);
  s.generations_completed =
      generations_completed_.load(std::memory_order_relaxed);
  s.generations_cancelled =
      generations_cancelled_.load(std::memory_order_relaxed);
  s.generations_failed = generations_failed_.load(std::memory_order_relaxed);
  s.prompt_tokens = prompt_tokens_.load(std::memory_order_relaxed);
  s.completion_tokens = completion_tokens_.load(std::memory_order_relaxed);
  s.truncated_prompts = truncated_prompts_.load(std::memory_order_relaxed);
  s.model_loads = model_loads_.load(std::memory_order_relaxed);
  s.model_load_failures = model_load_failures_.load(std::memory_order_relaxed);
  s.model_unloads = model_unloads_.load(std::memory_order_relaxed);
  s.active_tokens = active_tokens_.load(std::memory_order_relaxed);
  return s;
}

uint64_t MetricsRegistry::ResourceRejections(ResourceError error) const {
  std::lock_guard<std::mutex> lock(rejection_mutex_);
  auto it = rejections_.find(static_cast<int>(error));
  return it == rejections_.end() ? 0 : it->second;
}

std::string MetricsRegistry::RenderText() const {
  auto s = Take();
  std::ostringstream out;
  out << "generations_started " << s.generations_started << "\n";
  out << "generations_completed " << s.generations_completed << "\n";
  out << "generations_cancelled " << s.generations_cancelled << "\n";
  out << "generations_failed " << s.generations_failed << "\n";
  out << "prompt_tokens " << s.prompt_tokens << "\n";
  out << "completion_tokens " << s.completion_tokens << "\n";
  out << "truncated_prompts " << s.truncated_prompts << "\n";
  out << "truncated_tokens "
      << truncated_tokens_.load(std::memory_order_relaxed) << "\n";
  out << "model_loads " << s.model_loads << "\n";
  out << "model_load_failures " << s.model_load_failures << "\n";
  out << "model_unloads " << s.model_unloads << "\n";
  out << "active_tokens " << s.active_tokens << "\n";
  {
    std::lock_guard<std::mutex> lock(model_mutex_);
    if (!last_model_id_.empty()) {
      out << "last_model " << last_model_id_ << "\n";
    }
    if (!last_failed_model_id_.empty()) {
      out << "last_failed_model " << last_failed_model_id_ << "\n";
    }
  }
  {
    std::lock_guard<std::mutex> lock(rejection_mutex_);
    for (int kind = static_cast<int>(ResourceError::kRateLimited);
         kind <= static_cast<int>(ResourceError::kMemoryPressure); ++kind) {
      auto it = rejections_.find(kind);
      out << "resource_rejections{reason=\""
          << ResourceErrorName(static_cast<ResourceError>(kind)) << "\"} "
          << (it == rejections_.end() ? 0 : it->second) << "\n";
    }
  }

  auto render_histogram = [&](const char *name, const LatencyHistogram &h) {
    auto count = h.total.load(std::memory_order_relaxed);
    auto sum = h.sum_ms.load(std::memory_order_relaxed);
    out << name << "_count " << count << "\n";
    out << name << "_sum_ms " << sum << "\n";
    if (count > 0) {
      std::ostringstream mean;
      mean << std::fixed << std::setprecision(1)
           << static_cast<double>(sum) / static_cast<double>(count);
      out << name << "_mean_ms " << mean.str() << "\n";
    }
    for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
      out << name << "_bucket{le=\"" << LatencyHistogram::kBuckets[i] << "\"} "
          << h.counts[i].load(std::memory_order_relaxed) << "\n";
    }
    out << name << "_bucket{le=\"+Inf\"} "
        << h.counts[LatencyHistogram::kBuckets.size()].load(
               std::memory_order_relaxed)
        << "\n";
  };
  render_histogram("generation_latency", generation_latency_);
  render_histogram("model_load_latency", load_latency_);
  return out.str();
}

void MetricsRegistry::Reset() {
  generations_started_.store(0);
  generations_completed_.store(0);
  generations_cancelled_.store(0);
  generations_failed_.store(0);
  prompt_tokens_.store(0);
  completion_tokens_.store(0);
  truncated_prompts_.store(0);
  truncated_tokens_.store(0);
  model_loads_.store(0);
  model_load_failures_.store(0);
  model_unloads_.store(0);
  active_tokens_.store(0);
  for (auto *h : {&generation_latency_, &load_latency_}) {
    for (auto &c : h->counts) {
      c.store(0);
    }
    h->sum_ms.store(0);
    h->total.store(0);
  }
  {
    std::lock_guard<std::mutex> lock(rejection_mutex_);
    rejections_.clear();
  }
  std::lock_guard<std::mutex> lock(model_mutex_);
  last_model_id_.clear();
  last_failed_model_id_.clear();
}

MetricsRegistry &GlobalMetrics() { return g_metrics; }

} // namespace hiyo
