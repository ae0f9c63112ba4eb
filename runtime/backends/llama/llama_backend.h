#pragma once

#include "runtime/backends/inference_backend.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include <llama.h>

namespace hiyo {

struct LlamaBackendConfig {
  int32_t ctx_size = 4096;
  int32_t batch_size = 512;
  int gpu_layers = 0;
  bool use_mmap = true;
};

// InferenceBackend over llama.cpp. Owns the llama_model, its context and the
// vocabulary. A single KV sequence (id 0) backs the one live KVCache.
class LlamaBackend : public InferenceBackend {
public:
  // Called with the load fraction in [0, 1]. Returning false aborts the load.
  using LoadProgressFn = std::function<bool(float)>;

  LlamaBackend();
  ~LlamaBackend() override;

  LlamaBackend(const LlamaBackend &) = delete;
  LlamaBackend &operator=(const LlamaBackend &) = delete;

  bool LoadModel(const std::filesystem::path &model_path,
                 const LlamaBackendConfig &config = {},
                 LoadProgressFn progress = nullptr);

  bool IsReady() const { return context_ != nullptr; }

  std::string Name() const override { return "llama.cpp"; }
  std::unique_ptr<KVCache> NewCache() override;
  bool ForwardIncremental(const std::vector<int> &tokens, KVCache *cache,
                          std::vector<float> *logits) override;
  std::vector<int> Encode(const std::string &text) const override;
  std::optional<std::string>
  Decode(const std::vector<int> &ids) const override;
  int EosTokenId() const override;
  int ContextLength() const override {
    return context_ ? static_cast<int>(llama_n_ctx(context_)) : 0;
  }
  void ClearDeviceCache() override;

private:
  std::string TokenToString(int token) const;

  llama_model *model_{nullptr};
  llama_context *context_{nullptr};
  const llama_vocab *vocab_{nullptr};
  int32_t n_vocab_{0};
  LlamaBackendConfig config_;
  // Bumped by NewCache(); a cache from an older generation is stale.
  uint64_t cache_generation_{0};
};

} // namespace hiyo
