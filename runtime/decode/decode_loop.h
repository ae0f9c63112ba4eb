#pragma once

#include "common/errors.h"
#include "runtime/backends/inference_backend.h"
#include "runtime/generation_params.h"

#include <atomic>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace hiyo {

class ResourceGovernor;

struct DecodeLimits {
  // Prompts longer than this keep only their most recent tokens.
  int context_ceiling{16384};
  // Hard cap on generated tokens regardless of GenerationParams::max_tokens.
  int max_tokens_ceiling{4096};
};

// One generated token. `text` may be empty while a multi-byte UTF-8 character
// is still incomplete; the held-back bytes arrive with a later chunk.
struct DecodedChunk {
  std::string text;
  int token{-1};
  int index{0}; // 0-based position in the generated sequence.
};

enum class DecodeStep { kChunk, kFinished, kFailed };

enum class FinishReason {
  kNone,
  kEndOfSequence,
  kMaxTokens,
  kCancelled,
  kError,
};

const char *FinishReasonName(FinishReason reason);

// Autoregressive generation over one InferenceBackend. Pull-driven: each
// Next() runs at most one forward pass and returns at most one chunk.
//
// The first Next() creates a fresh KV cache and warms it with every prompt
// token except the last; every later step feeds exactly one token. For each
// emitted token one unit of governor budget is allocated; releasing the
// prompt allocation plus TokensGenerated() is the caller's job. Bytes still
// held back for an incomplete UTF-8 character when the loop finishes are
// dropped with a warning and counted in DroppedTokens().
//
// Not thread-safe: owned and driven by a single worker thread.
class DecodeLoop {
public:
  // `backend` must outlive the loop. `governor` may be null (no accounting);
  // the loop shares ownership so it stays valid for the loop's lifetime.
  // `cancel` may be null (not cancellable).
  DecodeLoop(InferenceBackend *backend, std::vector<int> prompt_tokens,
             const GenerationParams &params, const DecodeLimits &limits,
             std::shared_ptr<ResourceGovernor> governor,
             std::shared_ptr<std::atomic<bool>> cancel);

  DecodeStep Next(DecodedChunk *chunk);

  int TokensGenerated() const { return generated_; }
  // Prompt length after truncation to the context ceiling.
  int PromptTokens() const { return static_cast<int>(prompt_.size()); }
  bool PromptTruncated() const { return truncated_; }
  int EffectiveMaxTokens() const { return max_tokens_; }
  const std::vector<int> &GeneratedIds() const { return generated_ids_; }
  // Generated tokens whose bytes never formed valid UTF-8 and were discarded.
  int DroppedTokens() const { return dropped_tokens_; }

  FinishReason finish_reason() const { return finish_reason_; }
  const GenerationStatus &error() const { return error_; }

private:
  bool Cancelled() const;
  DecodeStep Finish(FinishReason reason);
  DecodeStep Fail(GenerationStatus status);
  bool Forward(const std::vector<int> &tokens, std::vector<float> *logits);
  void DropPending(const char *why);

  InferenceBackend *backend_;
  std::vector<int> prompt_;
  GenerationParams params_;
  std::shared_ptr<ResourceGovernor> governor_;
  std::shared_ptr<std::atomic<bool>> cancel_;
  std::mt19937 rng_;

  int max_tokens_{0};
  bool truncated_{false};
  std::unique_ptr<KVCache> cache_;
  std::vector<int> next_input_;
  std::vector<float> logits_;
  std::vector<int> generated_ids_;
  std::vector<int> pending_ids_; // Tokens whose text is not yet complete UTF-8.
  int generated_{0};
  int dropped_tokens_{0};
  bool done_{false};
  FinishReason finish_reason_{FinishReason::kNone};
  GenerationStatus error_;
};

} // namespace hiyo
