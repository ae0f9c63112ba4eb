#pragma once

#include "common/errors.h"
#include "runtime/decode/decode_loop.h"
#include "scheduler/model_lifecycle.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace hiyo {

class ResourceGovernor;

// Live, cancellable sequence of generated text.
//
// A dedicated worker thread drives the DecodeLoop and pushes non-empty text
// chunks into a bounded channel; the consumer pulls them with Next(). When
// the channel is full the worker blocks until the consumer catches up or the
// stream is cancelled.
//
// On every exit path (end of sequence, token limit, cancellation, error) the
// worker releases the prompt allocation plus one token per generated token
// back to the governor exactly once, then closes the channel. Cancellation
// is a clean close: Status() stays ok. A stream destroyed without ever
// starting its worker returns the prompt allocation and the lease itself.
// The stream shares ownership of the governor, so it may outlive the engine
// that created it.
//
//   auto stream = engine.Generate(messages, params).stream;
//   std::string piece;
//   while (stream->Next(&piece)) std::cout << piece;
//   if (!stream->Status().ok) ...
class GenerationStream {
public:
  GenerationStream(std::string model_id, DecodeLease lease,
                   std::unique_ptr<DecodeLoop> loop,
                   std::shared_ptr<ResourceGovernor> governor,
                   int prompt_allocation,
                   std::shared_ptr<std::atomic<bool>> cancel,
                   std::size_t channel_capacity = 64);
  // Cancels and joins the worker.
  ~GenerationStream();

  GenerationStream(const GenerationStream &) = delete;
  GenerationStream &operator=(const GenerationStream &) = delete;

  // Throws std::system_error when the worker thread cannot be created.
  void Start();

  // Blocks until the next chunk is available. Returns false once the stream
  // has closed and every buffered chunk has been delivered.
  bool Next(std::string *chunk);

  // Cooperative: the worker observes it at its next suspension point.
  void Cancel();
  bool IsCancelled() const { return cancel_->load(std::memory_order_acquire); }

  // Meaningful once Next() has returned false.
  GenerationStatus Status() const;
  FinishReason finish_reason() const;
  bool Closed() const;

  int TokensGenerated() const {
    return tokens_generated_.load(std::memory_order_acquire);
  }
  int PromptTokens() const { return prompt_allocation_; }
  const std::string &model_id() const { return model_id_; }

private:
  void WorkerLoop();
  // False when cancelled while waiting for room.
  bool Push(std::string chunk);
  void Close(FinishReason reason, GenerationStatus status);
  // Returns the budget and the lease; only the first call has an effect.
  void ReleaseResources(int generated);

  std::string model_id_;
  DecodeLease lease_;
  std::unique_ptr<DecodeLoop> loop_;
  std::shared_ptr<ResourceGovernor> governor_;
  int prompt_allocation_;
  bool released_{false};
  std::shared_ptr<std::atomic<bool>> cancel_;
  std::size_t capacity_;
  std::chrono::steady_clock::time_point started_;

  mutable std::mutex mutex_;
  std::condition_variable consumer_cv_;
  std::condition_variable producer_cv_;
  std::deque<std::string> chunks_;
  bool closed_{false};
  FinishReason finish_reason_{FinishReason::kNone};
  GenerationStatus status_;

  std::atomic<int> tokens_generated_{0};
  std::thread worker_;
};

} // namespace hiyo
