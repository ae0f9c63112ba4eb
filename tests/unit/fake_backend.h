#pragma once

// Scripted collaborators shared by the engine unit tests.

#include "model/model_loader.h"
#include "runtime/backends/backend_utils.h"
#include "runtime/backends/inference_backend.h"
#include "scheduler/memory_probe.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace hiyo {
namespace testing {

constexpr int kFakeVocab = 32;
constexpr int kFakeEos = 1;

class FakeCache : public KVCache {
public:
  int Length() const override { return length; }
  int length{0};
};

// Emits `script` one token per sampling step (one-hot logits), then EOS.
// Encode() yields one token per whitespace-separated word unless
// `prompt_length` forces a fixed count.
class FakeBackend : public InferenceBackend {
public:
  std::vector<int> script;
  int prompt_length{-1};
  int context_length{1 << 20};
  int fail_on_step{-1};     // ForwardIncremental returns false at this step.
  int non_finite_step{-1};  // Logits contain NaN at this step.
  std::map<int, std::string> pieces; // Token text; default "w<id> ".
  std::function<void(int step)> on_step; // Called before each sampling step.

  // Observations.
  std::atomic<int> steps{0};
  std::atomic<int> warm_tokens{0};
  std::atomic<int> caches_created{0};
  std::atomic<int> cache_clears{0};
  std::vector<int> warm_ids;  // Prompt tokens fed without logits; read only
                              // once the decoding thread has stopped.
  std::vector<int> step_ids;  // Input of each sampling step; same rule.
  std::atomic<bool> *destroyed{nullptr};

  ~FakeBackend() override {
    if (destroyed) {
      destroyed->store(true);
    }
  }

  std::string Name() const override { return "fake"; }

  std::unique_ptr<KVCache> NewCache() override {
    caches_created++;
    return std::make_unique<FakeCache>();
  }

  bool ForwardIncremental(const std::vector<int> &tokens, KVCache *cache,
                          std::vector<float> *logits) override {
    auto *fc = static_cast<FakeCache *>(cache);
    fc->length += static_cast<int>(tokens.size());
    if (logits == nullptr) {
      warm_tokens += static_cast<int>(tokens.size());
      warm_ids.insert(warm_ids.end(), tokens.begin(), tokens.end());
      return true;
    }
    step_ids.insert(step_ids.end(), tokens.begin(), tokens.end());
    int step = steps.fetch_add(1);
    if (on_step) {
      on_step(step);
    }
    if (step == fail_on_step) {
      return false;
    }
    logits->assign(kFakeVocab, 0.0f);
    int next = step < static_cast<int>(script.size()) ? script[step] : kFakeEos;
    (*logits)[next] = 20.0f;
    if (step == non_finite_step) {
      (*logits)[0] = std::numeric_limits<float>::quiet_NaN();
    }
    return true;
  }

  std::vector<int> Encode(const std::string &text) const override {
    if (prompt_length >= 0) {
      return std::vector<int>(prompt_length, 2);
    }
    std::vector<int> out;
    bool in_word = false;
    for (char c : text) {
      bool space = c == ' ' || c == '\n';
      if (!space && !in_word) {
        out.push_back(2 + static_cast<int>(out.size()) % (kFakeVocab - 2));
      }
      in_word = !space;
    }
    return out;
  }

  std::optional<std::string>
  Decode(const std::vector<int> &ids) const override {
    std::string text;
    for (int id : ids) {
      auto it = pieces.find(id);
      text += it != pieces.end() ? it->second : "w" + std::to_string(id) + " ";
    }
    if (EndsWithIncompleteUtf8(text)) {
      return std::nullopt;
    }
    return text;
  }

  int EosTokenId() const override { return kFakeEos; }
  int ContextLength() const override { return context_length; }
  void ClearDeviceCache() override { cache_clears++; }
};

// Loader whose result per model id is chosen by the test.
class FakeLoader : public ModelLoader {
public:
  // Builds the backend for a successful load.
  std::function<std::unique_ptr<FakeBackend>(const std::string &)> make_backend =
      [](const std::string &) {
        auto b = std::make_unique<FakeBackend>();
        b->script = {5, 6, 7};
        return b;
      };
  std::map<std::string, LoadErrorCode> failures;
  // Ids whose load blocks until cancelled.
  std::map<std::string, bool> block_until_cancelled;

  std::atomic<int> calls{0};
  std::atomic<bool> blocked{false};

  LoadedModel Load(const std::string &model_id, const ProgressFn &progress,
                   const std::atomic<bool> &cancel) override {
    calls++;
    if (progress) {
      progress(0.1);
    }
    if (block_until_cancelled.count(model_id)) {
      blocked.store(true);
      while (!cancel.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
      blocked.store(false);
      return LoadedModel::Cancelled();
    }
    auto fail = failures.find(model_id);
    if (fail != failures.end()) {
      return LoadedModel::Failure(fail->second, "scripted failure");
    }
    if (progress) {
      progress(0.4);
      progress(1.0);
    }
    LoadedModel out;
    out.ok = true;
    out.backend = make_backend(model_id);
    return out;
  }
};

class FakeMemoryProbe : public MemoryProbe {
public:
  MemoryReading Read() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return reading_;
  }
  void Set(uint64_t resident, uint64_t physical) {
    std::lock_guard<std::mutex> lock(mutex_);
    reading_ = {resident, physical};
  }

private:
  mutable std::mutex mutex_;
  MemoryReading reading_{};
};

// Manually advanced clock for the governor's rate windows.
struct FakeClock {
  std::chrono::steady_clock::time_point now{};
  std::mutex mutex;

  std::function<std::chrono::steady_clock::time_point()> Fn() {
    return [this] {
      std::lock_guard<std::mutex> lock(mutex);
      return now;
    };
  }
  void Advance(std::chrono::milliseconds ms) {
    std::lock_guard<std::mutex> lock(mutex);
    now += ms;
  }
};

} // namespace testing
} // namespace hiyo
