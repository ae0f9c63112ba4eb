#include "runtime/decode/decode_loop.h"

#include "common/logging/logger.h"
#include "common/metrics/metrics.h"
#include "runtime/sampling/sampler.h"
#include "scheduler/resource_governor.h"

#include <algorithm>
#include <stdexcept>

namespace hiyo {

namespace {
// Longest run of tokens held back waiting for a UTF-8 sequence to complete.
constexpr std::size_t kMaxPendingTokens = 8;

std::mt19937 MakeRng(uint32_t seed) {
  if (seed == UINT32_MAX) {
    std::random_device rd;
    return std::mt19937(rd());
  }
  return std::mt19937(seed);
}
} // namespace

const char *FinishReasonName(FinishReason reason) {
  switch (reason) {
  case FinishReason::kNone:
    return "none";
  case FinishReason::kEndOfSequence:
    return "eos";
  case FinishReason::kMaxTokens:
    return "max_tokens";
  case FinishReason::kCancelled:
    return "cancelled";
  case FinishReason::kError:
    return "error";
  }
  return "unknown";
}

DecodeLoop::DecodeLoop(InferenceBackend *backend,
                       std::vector<int> prompt_tokens,
                       const GenerationParams &params,
                       const DecodeLimits &limits,
                       std::shared_ptr<ResourceGovernor> governor,
                       std::shared_ptr<std::atomic<bool>> cancel)
    : backend_(backend), prompt_(std::move(prompt_tokens)), params_(params),
      governor_(std::move(governor)), cancel_(std::move(cancel)),
      rng_(MakeRng(params.seed)) {
  int ceiling = std::max(limits.context_ceiling, 1);
  if (static_cast<int>(prompt_.size()) > ceiling) {
    int dropped = static_cast<int>(prompt_.size()) - ceiling;
    prompt_.erase(prompt_.begin(), prompt_.begin() + dropped);
    truncated_ = true;
    GlobalMetrics().RecordPromptTruncated(dropped);
    log::Warn("decode", "prompt truncated",
              "kept=" + std::to_string(ceiling) +
                  " dropped=" + std::to_string(dropped));
  }

  max_tokens_ = std::min(params_.max_tokens, limits.max_tokens_ceiling);
  if (backend_ != nullptr && backend_->ContextLength() > 0) {
    max_tokens_ = std::min(max_tokens_, backend_->ContextLength());
  }
  max_tokens_ = std::max(max_tokens_, 0);
}

bool DecodeLoop::Cancelled() const {
  return cancel_ && cancel_->load(std::memory_order_acquire);
}

void DecodeLoop::DropPending(const char *why) {
  if (pending_ids_.empty()) {
    return;
  }
  log::Warn("decode", why, "tokens=" + std::to_string(pending_ids_.size()));
  dropped_tokens_ += static_cast<int>(pending_ids_.size());
  pending_ids_.clear();
}

DecodeStep DecodeLoop::Finish(FinishReason reason) {
  DropPending("dropping incomplete UTF-8 tail");
  done_ = true;
  finish_reason_ = reason;
  cache_.reset();
  return DecodeStep::kFinished;
}

DecodeStep DecodeLoop::Fail(GenerationStatus status) {
  DropPending("dropping incomplete UTF-8 tail");
  done_ = true;
  finish_reason_ = FinishReason::kError;
  error_ = std::move(status);
  cache_.reset();
  log::Error("decode", "generation failed",
             std::string("code=") + GenerationErrorCodeName(error_.code) +
                 " message=" + error_.message);
  return DecodeStep::kFailed;
}

bool DecodeLoop::Forward(const std::vector<int> &tokens,
                         std::vector<float> *logits) {
  try {
    return backend_->ForwardIncremental(tokens, cache_.get(), logits);
  } catch (const std::exception &ex) {
    log::Error("decode", "forward pass threw", ex.what());
    return false;
  }
}

DecodeStep DecodeLoop::Next(DecodedChunk *chunk) {
  if (done_) {
    return finish_reason_ == FinishReason::kError ? DecodeStep::kFailed
                                                  : DecodeStep::kFinished;
  }
  if (backend_ == nullptr) {
    return Fail(GenerationStatus::Failure(ErrorKind::kGeneration,
                                          GenerationErrorCode::kModelNotLoaded,
                                          "no backend"));
  }
  if (prompt_.empty()) {
    return Fail(GenerationStatus::Failure(ErrorKind::kValidation,
                                          GenerationErrorCode::kEmptyPrompt,
                                          "prompt encodes to zero tokens"));
  }
  if (Cancelled()) {
    return Finish(FinishReason::kCancelled);
  }
  if (generated_ >= max_tokens_) {
    return Finish(FinishReason::kMaxTokens);
  }

  if (!cache_) {
    cache_ = backend_->NewCache();
    if (prompt_.size() > 1) {
      std::vector<int> warm(prompt_.begin(), prompt_.end() - 1);
      if (!Forward(warm, nullptr)) {
        return Fail(GenerationStatus::Failure(
            ErrorKind::kGeneration, GenerationErrorCode::kForwardFailed,
            "prompt evaluation failed"));
      }
      if (Cancelled()) {
        return Finish(FinishReason::kCancelled);
      }
    }
    next_input_.assign(1, prompt_.back());
  }

  if (!Forward(next_input_, &logits_)) {
    return Fail(GenerationStatus::Failure(ErrorKind::kGeneration,
                                          GenerationErrorCode::kForwardFailed,
                                          "forward pass failed"));
  }
  if (Cancelled()) {
    return Finish(FinishReason::kCancelled);
  }

  int token = -1;
  try {
    token = SampleToken(logits_, params_.temperature, params_.top_p, rng_);
  } catch (const std::invalid_argument &ex) {
    return Fail(GenerationStatus::Failure(ErrorKind::kGeneration,
                                          GenerationErrorCode::kSamplingFailed,
                                          ex.what()));
  }

  if (token == backend_->EosTokenId()) {
    return Finish(FinishReason::kEndOfSequence);
  }

  if (governor_ != nullptr) {
    ResourceError rejected = governor_->Allocate(1);
    if (rejected != ResourceError::kNone) {
      return Fail(GenerationStatus::Failure(
          ErrorKind::kResource, GenerationErrorCode::kResourceRejected,
          ResourceErrorMessage(rejected), rejected));
    }
  }

  generated_ids_.push_back(token);
  ++generated_;
  next_input_.assign(1, token);

  pending_ids_.push_back(token);
  chunk->text.clear();
  auto text = backend_->Decode(pending_ids_);
  if (text) {
    chunk->text = std::move(*text);
    pending_ids_.clear();
  } else if (pending_ids_.size() >= kMaxPendingTokens) {
    DropPending("dropping undecodable token run");
  }
  chunk->token = token;
  chunk->index = generated_ - 1;
  return DecodeStep::kChunk;
}

} // namespace hiyo
