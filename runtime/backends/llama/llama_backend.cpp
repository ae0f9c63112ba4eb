#include "runtime/backends/llama/llama_backend.h"

#include "common/logging/logger.h"
#include "runtime/backends/backend_utils.h"

#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace {

void BatchClear(llama_batch &batch) { batch.n_tokens = 0; }

void BatchAdd(llama_batch &batch, llama_token id, llama_pos pos, bool logits) {
  if (!batch.seq_id[batch.n_tokens]) {
    throw std::runtime_error("llama_batch capacity exceeded");
  }
  batch.token[batch.n_tokens] = id;
  batch.pos[batch.n_tokens] = pos;
  batch.n_seq_id[batch.n_tokens] = 1;
  batch.seq_id[batch.n_tokens][0] = 0;
  batch.logits[batch.n_tokens] = logits ? 1 : 0;
  batch.n_tokens++;
}

} // namespace

namespace hiyo {

namespace {
std::mutex g_llama_init_mutex;
int g_llama_init_refcount = 0;

void LlamaBackendAcquire() {
  std::lock_guard<std::mutex> lock(g_llama_init_mutex);
  if (g_llama_init_refcount++ == 0) {
    llama_backend_init();
  }
}

void LlamaBackendRelease() {
  std::lock_guard<std::mutex> lock(g_llama_init_mutex);
  if (--g_llama_init_refcount == 0) {
    llama_backend_free();
  }
}

class LlamaKVCache : public KVCache {
public:
  explicit LlamaKVCache(uint64_t generation) : generation_(generation) {}
  int Length() const override { return static_cast<int>(position_); }

  uint64_t generation_;
  llama_pos position_{0};
};

bool ProgressTrampoline(float progress, void *user_data) {
  auto *fn = static_cast<LlamaBackend::LoadProgressFn *>(user_data);
  return (*fn)(progress);
}
} // namespace

LlamaBackend::LlamaBackend() { LlamaBackendAcquire(); }

LlamaBackend::~LlamaBackend() {
  if (context_ != nullptr) {
    llama_free(context_);
    context_ = nullptr;
  }
  if (model_ != nullptr) {
    llama_model_free(model_);
    model_ = nullptr;
  }
  vocab_ = nullptr;
  LlamaBackendRelease();
}

bool LlamaBackend::LoadModel(const std::filesystem::path &model_path,
                             const LlamaBackendConfig &config,
                             LoadProgressFn progress) {
  if (!std::filesystem::exists(model_path)) {
    log::Error("llama_backend", "model path does not exist",
               "path=" + model_path.string());
    return false;
  }
  llama_model_params model_params = llama_model_default_params();
  model_params.n_gpu_layers = config.gpu_layers;
  model_params.use_mmap = config.use_mmap;
  if (progress) {
    model_params.progress_callback = ProgressTrampoline;
    model_params.progress_callback_user_data = &progress;
  }

  model_ =
      llama_model_load_from_file(model_path.string().c_str(), model_params);
  if (!model_) {
    log::Error("llama_backend", "failed to load model",
               "path=" + model_path.string());
    return false;
  }

  llama_context_params ctx_params = llama_context_default_params();
  ctx_params.n_ctx = static_cast<uint32_t>(std::max(config.ctx_size, 16));
  ctx_params.n_batch = static_cast<uint32_t>(std::max(config.batch_size, 1));
  ctx_params.n_seq_max = 1;

  context_ = llama_init_from_model(model_, ctx_params);
  if (!context_) {
    log::Error("llama_backend", "failed to create context");
    return false;
  }
  vocab_ = llama_model_get_vocab(model_);
  if (!vocab_) {
    log::Error("llama_backend", "failed to obtain vocabulary");
    return false;
  }
  n_vocab_ = llama_vocab_n_tokens(vocab_);
  config_ = config;
  log::Info("llama_backend", "model ready",
            "path=" + model_path.string() +
                " n_ctx=" + std::to_string(llama_n_ctx(context_)) +
                " n_vocab=" + std::to_string(n_vocab_));
  return true;
}

std::unique_ptr<KVCache> LlamaBackend::NewCache() {
  if (context_) {
    llama_memory_seq_rm(llama_get_memory(context_), 0, -1, -1);
  }
  return std::make_unique<LlamaKVCache>(++cache_generation_);
}

bool LlamaBackend::ForwardIncremental(const std::vector<int> &tokens,
                                      KVCache *cache,
                                      std::vector<float> *logits) {
  auto *kv = dynamic_cast<LlamaKVCache *>(cache);
  if (!IsReady() || kv == nullptr || tokens.empty()) {
    return false;
  }
  if (kv->generation_ != cache_generation_) {
    log::Error("llama_backend", "stale KV cache passed to forward pass");
    return false;
  }

  llama_pos n_ctx = static_cast<llama_pos>(llama_n_ctx(context_));
  std::size_t first = 0;
  if (static_cast<llama_pos>(tokens.size()) >= n_ctx) {
    // Only the tail fits: start the sequence over from it.
    first = tokens.size() - static_cast<std::size_t>(n_ctx - 1);
    llama_memory_seq_rm(llama_get_memory(context_), 0, -1, -1);
    kv->position_ = 0;
    log::Warn("llama_backend", "input exceeds context, keeping tail",
              "tokens=" + std::to_string(tokens.size()) +
                  " n_ctx=" + std::to_string(n_ctx));
  }

  // Sliding-window eviction: drop the oldest half of the sequence when the
  // new tokens would not fit, and shift the remaining positions down.
  llama_pos incoming = static_cast<llama_pos>(tokens.size() - first);
  if (kv->position_ + incoming > n_ctx - 1 && n_ctx > 1) {
    llama_pos keep = std::max<llama_pos>(0, n_ctx / 2 - incoming);
    llama_pos discard = kv->position_ - keep;
    if (discard > 0) {
      llama_memory_seq_rm(llama_get_memory(context_), 0, 0, discard);
      llama_memory_seq_add(llama_get_memory(context_), 0, discard,
                           static_cast<llama_pos>(-1), -discard);
      kv->position_ -= discard;
    }
  }

  int32_t batch_cap = std::max<int32_t>(config_.batch_size, 1);
  llama_batch batch = llama_batch_init(batch_cap, 0, 1);
  std::size_t i = first;
  while (i < tokens.size()) {
    BatchClear(batch);
    std::size_t end = std::min(tokens.size(), i + batch_cap);
    for (; i < end; ++i) {
      BatchAdd(batch, tokens[i], kv->position_++, i == tokens.size() - 1);
    }
    if (llama_decode(context_, batch) != 0) {
      log::Error("llama_backend", "llama_decode failed",
                 "position=" + std::to_string(kv->position_));
      llama_batch_free(batch);
      return false;
    }
  }
  llama_batch_free(batch);

  const float *row = llama_get_logits_ith(context_, -1);
  if (row == nullptr) {
    log::Error("llama_backend", "no logits for last position");
    return false;
  }
  if (logits) {
    logits->assign(row, row + n_vocab_);
  }
  return true;
}

std::vector<int> LlamaBackend::Encode(const std::string &text) const {
  if (!vocab_) {
    return {};
  }
  std::vector<llama_token> tokens;
  tokens.resize(text.size() + 8);
  int n = llama_tokenize(vocab_, text.c_str(), static_cast<int32_t>(text.size()),
                         tokens.data(), static_cast<int32_t>(tokens.size()),
                         /*add_special=*/true, /*parse_special=*/true);
  if (n < 0) {
    tokens.resize(static_cast<std::size_t>(-n));
    n = llama_tokenize(vocab_, text.c_str(), static_cast<int32_t>(text.size()),
                       tokens.data(), static_cast<int32_t>(tokens.size()),
                       true, true);
  }
  if (n < 0) {
    log::Error("llama_backend", "tokenization failed");
    return {};
  }
  return std::vector<int>(tokens.begin(), tokens.begin() + n);
}

std::string LlamaBackend::TokenToString(int token) const {
  if (!vocab_) {
    return {};
  }
  std::string buf;
  buf.resize(16);
  int written =
      llama_token_to_piece(vocab_, token, buf.data(), buf.size(), 0, false);
  if (written < 0) {
    buf.resize(static_cast<std::size_t>(-written));
    if (llama_token_to_piece(vocab_, token, buf.data(), buf.size(), 0, false) <
        0) {
      return {};
    }
  } else {
    buf.resize(static_cast<std::size_t>(written));
  }
  return buf;
}

std::optional<std::string>
LlamaBackend::Decode(const std::vector<int> &ids) const {
  std::string text;
  for (int id : ids) {
    text += TokenToString(id);
  }
  if (EndsWithIncompleteUtf8(text)) {
    return std::nullopt;
  }
  return text;
}

int LlamaBackend::EosTokenId() const {
  return vocab_ ? static_cast<int>(llama_vocab_eos(vocab_)) : -1;
}

void LlamaBackend::ClearDeviceCache() {
  if (context_) {
    llama_memory_clear(llama_get_memory(context_), true);
  }
}

} // namespace hiyo
