#include "scheduler/model_lifecycle.h"

#include "common/logging/logger.h"
#include "common/metrics/metrics.h"
#include "model/model_id.h"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace hiyo {

const char *LoadPhaseName(LoadPhase phase) {
  switch (phase) {
  case LoadPhase::kIdle:
    return "idle";
  case LoadPhase::kLoading:
    return "loading";
  case LoadPhase::kLoaded:
    return "loaded";
  case LoadPhase::kFailed:
    return "failed";
  }
  return "unknown";
}

std::string LoadState::CurrentModel() const {
  if (phase == LoadPhase::kLoading || phase == LoadPhase::kLoaded) {
    return model_id;
  }
  return "None";
}

std::string LoadState::Describe() const {
  std::ostringstream out;
  out << LoadPhaseName(phase);
  switch (phase) {
  case LoadPhase::kIdle:
    break;
  case LoadPhase::kLoading:
    out << " " << model_id << " " << static_cast<int>(progress * 100.0) << "%";
    break;
  case LoadPhase::kLoaded:
    out << " " << model_id;
    break;
  case LoadPhase::kFailed:
    out << " " << model_id << " (" << LoadErrorCodeName(error) << ": "
        << error_message << ")";
    break;
  }
  return out.str();
}

// ── ModelHandle / DecodeLease ───────────────────────────────────────────────

ModelHandle::ModelHandle(std::string model_id,
                         std::unique_ptr<InferenceBackend> backend)
    : model_id_(std::move(model_id)), backend_(std::move(backend)) {}

ModelHandle::~ModelHandle() {
  if (backend_) {
    backend_->ClearDeviceCache();
  }
  log::Debug("lifecycle", "model handle released", "id=" + model_id_);
}

DecodeLease ModelHandle::TryLease(const std::shared_ptr<ModelHandle> &handle) {
  if (!handle) {
    return DecodeLease();
  }
  bool expected = false;
  if (!handle->in_use_.compare_exchange_strong(expected, true,
                                               std::memory_order_acq_rel)) {
    return DecodeLease();
  }
  return DecodeLease(handle);
}

void DecodeLease::Release() {
  if (handle_) {
    handle_->in_use_.store(false, std::memory_order_release);
    handle_.reset();
  }
}

ErrorKind LoadResult::kind() const {
  switch (outcome) {
  case Outcome::kLoaded:
  case Outcome::kSuperseded:
    return ErrorKind::kNone;
  case Outcome::kFailed:
    break;
  }
  return code == LoadErrorCode::kInvalidIdentifier ? ErrorKind::kValidation
                                                    : ErrorKind::kLoad;
}

// ── ModelLifecycleManager ───────────────────────────────────────────────────

ModelLifecycleManager::ModelLifecycleManager(
    std::shared_ptr<ModelLoader> loader)
    : loader_(std::move(loader)) {}

ModelLifecycleManager::~ModelLifecycleManager() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (load_cancel_) {
    load_cancel_->store(true);
  }
}

uint64_t ModelLifecycleManager::SetStateLocked(LoadState state) {
  state_ = std::move(state);
  return ++state_version_;
}

void ModelLifecycleManager::Publish(uint64_t version, const LoadState &state) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  if (version <= published_version_) {
    return; // A newer state has already been delivered.
  }
  published_version_ = version;
  if (listener_) {
    listener_(state);
  }
}

void ModelLifecycleManager::SetStateListener(StateListener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listener_ = std::move(listener);
}

LoadState ModelLifecycleManager::CurrentState() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

std::shared_ptr<ModelHandle> ModelLifecycleManager::CurrentHandle() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return handle_;
}

LoadResult ModelLifecycleManager::Load(const std::string &model_id,
                                       const ModelLoader::ProgressFn &progress) {
  LoadResult result;
  std::string reason;
  if (!ValidateModelId(model_id, &reason)) {
    log::Warn("lifecycle", "rejected model id", reason);
    result.code = LoadErrorCode::kInvalidIdentifier;
    result.message = reason;
    return result;
  }

  auto cancel = std::make_shared<std::atomic<bool>>(false);
  uint64_t epoch = 0;
  LoadState published;
  uint64_t version = 0;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    epoch = ++load_epoch_;
    if (load_cancel_) {
      load_cancel_->store(true);
    }
    load_cancel_ = cancel;
    LoadState loading;
    loading.phase = LoadPhase::kLoading;
    loading.model_id = model_id;
    version = SetStateLocked(loading);
    published = state_;
  }
  Publish(version, published);

  // Wait for any earlier load to observe its cancellation and return.
  std::lock_guard<std::mutex> serial(load_mutex_);
  if (cancel->load()) {
    result.outcome = LoadResult::Outcome::kSuperseded;
    return result;
  }

  log::Info("lifecycle", "loading model", "id=" + model_id);
  auto start = std::chrono::steady_clock::now();

  double last_progress = 0.0;
  auto on_progress = [&](double p) {
    p = std::min(1.0, std::max(last_progress, p));
    last_progress = p;
    LoadState snapshot;
    uint64_t v = 0;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (epoch != load_epoch_ || state_.phase != LoadPhase::kLoading) {
        return;
      }
      state_.progress = p;
      v = ++state_version_;
      snapshot = state_;
    }
    Publish(v, snapshot);
    if (progress) {
      progress(p);
    }
  };

  LoadedModel loaded;
  if (loader_) {
    loaded = loader_->Load(model_id, on_progress, *cancel);
  } else {
    loaded = LoadedModel::Failure(LoadErrorCode::kLoadFailed,
                                  "no model loader configured");
  }
  double load_ms = std::chrono::duration<double, std::milli>(
                       std::chrono::steady_clock::now() - start)
                       .count();

  std::shared_ptr<ModelHandle> previous;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (epoch != load_epoch_ || cancel->load()) {
      // Superseded by a newer Load() or an Unload(): discard silently.
      result.outcome = LoadResult::Outcome::kSuperseded;
    } else if (!loaded.ok) {
      if (loaded.cancelled) {
        loaded.code = LoadErrorCode::kLoadFailed;
        loaded.message = "loader stopped without a cancellation request";
      }
      LoadState failed;
      failed.phase = LoadPhase::kFailed;
      failed.model_id = model_id;
      failed.error = loaded.code;
      failed.error_message = loaded.message;
      version = SetStateLocked(failed);
      published = state_;
      load_cancel_.reset();
      result.outcome = LoadResult::Outcome::kFailed;
      result.code = loaded.code;
      result.message = loaded.message;
    } else {
      previous = std::move(handle_);
      handle_ = std::make_shared<ModelHandle>(model_id,
                                              std::move(loaded.backend));
      LoadState ready;
      ready.phase = LoadPhase::kLoaded;
      ready.model_id = model_id;
      version = SetStateLocked(ready);
      published = state_;
      load_cancel_.reset();
      result.outcome = LoadResult::Outcome::kLoaded;
    }
  }

  switch (result.outcome) {
  case LoadResult::Outcome::kSuperseded:
    log::Info("lifecycle", "load superseded", "id=" + model_id);
    break;
  case LoadResult::Outcome::kFailed:
    Publish(version, published);
    GlobalMetrics().RecordModelLoadFailure(model_id);
    log::Error("lifecycle", "model load failed",
               "id=" + model_id + " code=" + LoadErrorCodeName(result.code) +
                   " message=" + result.message);
    break;
  case LoadResult::Outcome::kLoaded:
    Publish(version, published);
    GlobalMetrics().RecordModelLoad(model_id, load_ms);
    log::Info("lifecycle", "model loaded",
              "id=" + model_id +
                  " load_ms=" + std::to_string(static_cast<int64_t>(load_ms)));
    break;
  }
  // `previous` is released here, outside the state lock.
  return result;
}

void ModelLifecycleManager::Unload() {
  std::shared_ptr<ModelHandle> previous;
  LoadState published;
  uint64_t version = 0;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++load_epoch_;
    if (load_cancel_) {
      load_cancel_->store(true);
      load_cancel_.reset();
    }
    previous = std::move(handle_);
    version = SetStateLocked(LoadState{});
    published = state_;
  }
  Publish(version, published);
  if (previous) {
    std::string id = previous->model_id();
    bool busy = previous->InUse();
    previous.reset();
    GlobalMetrics().RecordModelUnload();
    log::Info("lifecycle", "model unloaded",
              "id=" + id + (busy ? " pending_generation=1" : ""));
  }
}

} // namespace hiyo
