#pragma once

#include "common/errors.h"
#include "runtime/backends/inference_backend.h"
#include "runtime/backends/llama/llama_backend.h"

#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>

namespace hiyo {

// Fields read from an optional config.json beside the weights.
struct ModelMetadata {
  std::string model_type;
  int max_position_embeddings{0};
  int vocab_size{0};
};

struct LoadedModel {
  bool ok{false};
  bool cancelled{false}; // Load stopped at a cancellation point; not an error.
  LoadErrorCode code{LoadErrorCode::kNone};
  std::string message;
  std::unique_ptr<InferenceBackend> backend;
  std::filesystem::path weights_path;
  ModelMetadata metadata;

  static LoadedModel Failure(LoadErrorCode code, std::string message);
  static LoadedModel Cancelled();
};

// Turns a validated model id into a ready InferenceBackend. Load() runs on the
// lifecycle manager's thread and must poll `cancel` at its suspension points.
// Progress values are monotonically non-decreasing in [0, 1].
class ModelLoader {
public:
  using ProgressFn = std::function<void(double)>;

  virtual ~ModelLoader() = default;
  virtual LoadedModel Load(const std::string &model_id,
                           const ProgressFn &progress,
                           const std::atomic<bool> &cancel) = 0;
};

struct LocalModelLoaderConfig {
  std::filesystem::path models_dir;
  // Non-empty: only these ids may be loaded.
  std::set<std::string> allow_list;
  // Explicit weights directory per id, bypassing <models_dir>/<owner>/<name>.
  std::map<std::string, std::filesystem::path> directory_overrides;
  LlamaBackendConfig backend;
};

// Loads GGUF weights from local disk through llama.cpp. Never downloads.
//
// Directory layout:
//   <models_dir>/<owner>/<name>/
//     config.json          (optional)
//     *.gguf               (first in name order is loaded)
class LocalModelLoader : public ModelLoader {
public:
  explicit LocalModelLoader(LocalModelLoaderConfig config);

  LoadedModel Load(const std::string &model_id, const ProgressFn &progress,
                   const std::atomic<bool> &cancel) override;

  // Resolves and checks the weights directory for `model_id`. On failure
  // returns an empty path and fills *code / *message.
  std::filesystem::path ResolveModelDirectory(const std::string &model_id,
                                              LoadErrorCode *code,
                                              std::string *message) const;

  static ModelMetadata ParseMetadata(const std::filesystem::path &config_path);
  static std::filesystem::path FindWeights(const std::filesystem::path &dir);

  const LocalModelLoaderConfig &config() const { return config_; }

private:
  LocalModelLoaderConfig config_;
};

} // namespace hiyo
