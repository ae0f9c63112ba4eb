#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hiyo {

// Per-generation key/value cache owned by one decode loop. Backends subclass
// it to hold whatever position/sequence bookkeeping they need.
class KVCache {
public:
  virtual ~KVCache() = default;
  // Number of token positions already evaluated into the cache.
  virtual int Length() const = 0;
};

// Forward pass and tokenizer for one loaded model. A ModelHandle owns exactly
// one backend; the single-flight lease on the handle guarantees that at most
// one decode loop calls into it at a time, so implementations need no
// internal locking for the forward-pass methods.
class InferenceBackend {
public:
  virtual ~InferenceBackend() = default;

  virtual std::string Name() const = 0;

  // Fresh, empty cache. Any previous cache from this backend is invalidated.
  virtual std::unique_ptr<KVCache> NewCache() = 0;

  // Evaluate `tokens` on top of `cache`, advancing it by tokens.size()
  // positions. On success *logits holds the distribution for the position
  // after the last token (vocabulary-sized). Returns false on failure; the
  // cache must then be discarded.
  virtual bool ForwardIncremental(const std::vector<int> &tokens,
                                  KVCache *cache,
                                  std::vector<float> *logits) = 0;

  virtual std::vector<int> Encode(const std::string &text) const = 0;

  // Text for `ids`, or nullopt when the bytes end inside an incomplete UTF-8
  // sequence (the caller retries with more ids appended).
  virtual std::optional<std::string>
  Decode(const std::vector<int> &ids) const = 0;

  virtual int EosTokenId() const = 0;
  virtual int ContextLength() const = 0;

  // Return transient device buffers to the allocator. Called on unload.
  virtual void ClearDeviceCache() {}
};

} // namespace hiyo
