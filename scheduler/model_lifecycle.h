#pragma once

#include "common/errors.h"
#include "model/model_loader.h"
#include "runtime/backends/inference_backend.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace hiyo {

enum class LoadPhase { kIdle, kLoading, kLoaded, kFailed };

const char *LoadPhaseName(LoadPhase phase);

// Snapshot of the lifecycle state machine:
//   Idle -> Loading -> {Loaded | Failed}
//   Loaded -> Loading, Failed -> Loading
//   any -> Idle (unload)
struct LoadState {
  LoadPhase phase{LoadPhase::kIdle};
  std::string model_id;       // Loading / Loaded / Failed.
  double progress{0.0};       // Loading only, in [0, 1].
  LoadErrorCode error{LoadErrorCode::kNone}; // Failed only.
  std::string error_message;                 // Failed only.

  // Model id while loading or loaded, otherwise "None".
  std::string CurrentModel() const;
  bool IsLoading() const { return phase == LoadPhase::kLoading; }
  double LoadingProgress() const {
    return phase == LoadPhase::kLoading ? progress : 0.0;
  }
  std::string Describe() const;
};

class DecodeLease;

// One loaded model. Shared between the lifecycle manager and in-flight
// generations; the weights are freed and the device cache cleared when the
// last reference drops.
class ModelHandle {
public:
  ModelHandle(std::string model_id, std::unique_ptr<InferenceBackend> backend);
  ~ModelHandle();

  ModelHandle(const ModelHandle &) = delete;
  ModelHandle &operator=(const ModelHandle &) = delete;

  const std::string &model_id() const { return model_id_; }
  InferenceBackend *backend() const { return backend_.get(); }

  // Single-flight: at most one decode loop may use the backend's cache at a
  // time. Returns an invalid lease when another holder exists.
  static DecodeLease TryLease(const std::shared_ptr<ModelHandle> &handle);
  bool InUse() const { return in_use_.load(std::memory_order_acquire); }

private:
  friend class DecodeLease;

  std::string model_id_;
  std::unique_ptr<InferenceBackend> backend_;
  std::atomic<bool> in_use_{false};
};

// Exclusive right to run a decode loop on a ModelHandle. Movable so it can be
// handed to the worker thread; releases on destruction from any thread.
class DecodeLease {
public:
  DecodeLease() = default;
  ~DecodeLease() { Release(); }

  DecodeLease(DecodeLease &&other) noexcept
      : handle_(std::move(other.handle_)) {}
  DecodeLease &operator=(DecodeLease &&other) noexcept {
    if (this != &other) {
      Release();
      handle_ = std::move(other.handle_);
    }
    return *this;
  }
  DecodeLease(const DecodeLease &) = delete;
  DecodeLease &operator=(const DecodeLease &) = delete;

  bool valid() const { return handle_ != nullptr; }
  explicit operator bool() const { return valid(); }
  ModelHandle *handle() const { return handle_.get(); }

  void Release();

private:
  friend class ModelHandle;
  explicit DecodeLease(std::shared_ptr<ModelHandle> handle)
      : handle_(std::move(handle)) {}

  std::shared_ptr<ModelHandle> handle_;
};

struct LoadResult {
  enum class Outcome { kLoaded, kSuperseded, kFailed };

  Outcome outcome{Outcome::kFailed};
  LoadErrorCode code{LoadErrorCode::kNone};
  std::string message;

  bool ok() const { return outcome == Outcome::kLoaded; }
  // kInvalidIdentifier is a validation error; every other code is a load
  // error.
  ErrorKind kind() const;
};

// Owns the current ModelHandle and serialises loads.
//
//   A new Load() cancels the in-flight one, waits for it to stop, then runs.
//   The superseded call returns kSuperseded and never touches state.
//   Success swaps the handle atomically; failure sets Failed and keeps the
//   previous handle current.
//
// Thread safety: all public methods are thread-safe. Load() blocks the caller
// for the duration of the load.
class ModelLifecycleManager {
public:
  using StateListener = std::function<void(const LoadState &)>;

  explicit ModelLifecycleManager(std::shared_ptr<ModelLoader> loader);
  ~ModelLifecycleManager();

  LoadResult Load(const std::string &model_id,
                  const ModelLoader::ProgressFn &progress = nullptr);
  void Unload();

  LoadState CurrentState() const;
  std::shared_ptr<ModelHandle> CurrentHandle() const;
  bool IsAvailable() const { return CurrentHandle() != nullptr; }

  // Receives every state transition, in order, last value wins. Invoked on
  // the thread that caused the transition, outside internal locks.
  void SetStateListener(StateListener listener);

private:
  // Caller holds state_mutex_. Returns the version to pass to Publish().
  uint64_t SetStateLocked(LoadState state);
  void Publish(uint64_t version, const LoadState &state);

  std::shared_ptr<ModelLoader> loader_;

  mutable std::mutex state_mutex_;
  LoadState state_;
  std::shared_ptr<ModelHandle> handle_;
  uint64_t load_epoch_{0};
  std::shared_ptr<std::atomic<bool>> load_cancel_;
  uint64_t state_version_{0};

  std::mutex load_mutex_; // Held for the duration of one loader call.

  std::mutex listener_mutex_;
  StateListener listener_;
  uint64_t published_version_{0};
};

} // namespace hiyo
