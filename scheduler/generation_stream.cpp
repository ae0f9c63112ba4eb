#include "scheduler/generation_stream.h"

#include "common/logging/logger.h"
#include "common/metrics/metrics.h"
#include "scheduler/resource_governor.h"

#include <algorithm>

namespace hiyo {

GenerationStream::GenerationStream(std::string model_id, DecodeLease lease,
                                   std::unique_ptr<DecodeLoop> loop,
                                   std::shared_ptr<ResourceGovernor> governor,
                                   int prompt_allocation,
                                   std::shared_ptr<std::atomic<bool>> cancel,
                                   std::size_t channel_capacity)
    : model_id_(std::move(model_id)), lease_(std::move(lease)),
      loop_(std::move(loop)), governor_(std::move(governor)),
      prompt_allocation_(prompt_allocation), cancel_(std::move(cancel)),
      capacity_(std::max<std::size_t>(channel_capacity, 1)) {
  if (!cancel_) {
    cancel_ = std::make_shared<std::atomic<bool>>(false);
  }
}

GenerationStream::~GenerationStream() {
  Cancel();
  if (worker_.joinable()) {
    worker_.join();
  }
  // No-op once the worker has run; a stream that never started only holds
  // its prompt allocation.
  loop_.reset();
  ReleaseResources(0);
}

void GenerationStream::ReleaseResources(int generated) {
  if (released_) {
    return;
  }
  released_ = true;
  if (governor_) {
    governor_->Release(prompt_allocation_ + generated);
  }
  lease_.Release();
}

void GenerationStream::Start() {
  started_ = std::chrono::steady_clock::now();
  worker_ = std::thread(&GenerationStream::WorkerLoop, this);
}

void GenerationStream::Cancel() {
  cancel_->store(true, std::memory_order_release);
  std::lock_guard<std::mutex> lock(mutex_);
  producer_cv_.notify_all();
}

bool GenerationStream::Push(std::string chunk) {
  std::unique_lock<std::mutex> lock(mutex_);
  producer_cv_.wait(lock, [&] {
    return chunks_.size() < capacity_ || cancel_->load(std::memory_order_acquire);
  });
  if (cancel_->load(std::memory_order_acquire)) {
    return false;
  }
  chunks_.push_back(std::move(chunk));
  consumer_cv_.notify_one();
  return true;
}

bool GenerationStream::Next(std::string *chunk) {
  std::unique_lock<std::mutex> lock(mutex_);
  consumer_cv_.wait(lock, [&] { return !chunks_.empty() || closed_; });
  if (chunks_.empty()) {
    return false;
  }
  *chunk = std::move(chunks_.front());
  chunks_.pop_front();
  producer_cv_.notify_one();
  return true;
}

void GenerationStream::WorkerLoop() {
  DecodedChunk chunk;
  bool cancelled_in_push = false;
  DecodeStep step = DecodeStep::kFinished;
  while (true) {
    step = loop_->Next(&chunk);
    if (step != DecodeStep::kChunk) {
      break;
    }
    tokens_generated_.store(loop_->TokensGenerated(), std::memory_order_release);
    if (!chunk.text.empty() && !Push(std::move(chunk.text))) {
      cancelled_in_push = true;
      break;
    }
  }

  int generated = loop_->TokensGenerated();
  GenerationStatus error = loop_->error();
  FinishReason reason =
      cancelled_in_push ? FinishReason::kCancelled : loop_->finish_reason();
  // The loop's cache belongs to the leased backend: drop it first.
  loop_.reset();
  tokens_generated_.store(generated, std::memory_order_release);
  ReleaseResources(generated);

  double elapsed_ms = std::chrono::duration<double, std::milli>(
                          std::chrono::steady_clock::now() - started_)
                          .count();
  std::string extra = "model=" + model_id_ +
                      " prompt_tokens=" + std::to_string(prompt_allocation_) +
                      " tokens=" + std::to_string(generated) + " latency_ms=" +
                      std::to_string(static_cast<int64_t>(elapsed_ms));

  if (step == DecodeStep::kFailed) {
    GlobalMetrics().RecordGenerationFailed();
    log::Warn("stream", "generation ended with error",
              extra + " code=" + GenerationErrorCodeName(error.code));
    Close(FinishReason::kError, std::move(error));
    return;
  }
  if (reason == FinishReason::kCancelled) {
    GlobalMetrics().RecordGenerationCancelled(prompt_allocation_, generated);
    log::Info("stream", "generation cancelled", extra);
  } else {
    GlobalMetrics().RecordGenerationFinished(prompt_allocation_, generated,
                                             elapsed_ms);
    log::Info("stream", "generation completed",
              extra + " finish=" + FinishReasonName(reason));
  }
  Close(reason, GenerationStatus{});
}

void GenerationStream::Close(FinishReason reason, GenerationStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  finish_reason_ = reason;
  status_ = std::move(status);
  closed_ = true;
  consumer_cv_.notify_all();
}

GenerationStatus GenerationStream::Status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

FinishReason GenerationStream::finish_reason() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return finish_reason_;
}

bool GenerationStream::Closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

} // namespace hiyo
