#pragma once

#include "common/errors.h"
#include "runtime/decode/decode_loop.h"
#include "runtime/generation_params.h"
#include "scheduler/chat_prompt.h"
#include "scheduler/generation_stream.h"
#include "scheduler/model_lifecycle.h"
#include "scheduler/resource_governor.h"

#include <memory>
#include <string>
#include <vector>

namespace hiyo {

struct EngineOptions {
  DecodeLimits limits;
  std::size_t channel_capacity{64};
  GovernorConfig governor;
};

struct GenerateResult {
  std::unique_ptr<GenerationStream> stream; // Set when status.ok.
  GenerationStatus status;

  bool ok() const { return status.ok && stream != nullptr; }
};

// Consumer-facing entry point: model lifecycle plus streaming generation.
//
// Generate() runs, in order: resolve the current handle, take its
// single-flight lease, validate params, governor admission, prompt encoding,
// prompt-token allocation. Any failure releases what was taken and returns
// the error without starting a worker.
//
// The governor is shared with every stream, so a stream may outlive the
// engine that produced it.
class GenerationEngine {
public:
  explicit GenerationEngine(std::shared_ptr<ModelLoader> loader,
                            EngineOptions options = {},
                            std::shared_ptr<const MemoryProbe> probe = nullptr,
                            ResourceGovernor::NowFn now = nullptr);

  LoadResult LoadModel(const std::string &model_id,
                       const ModelLoader::ProgressFn &progress = nullptr);
  void UnloadModel();

  GenerateResult Generate(const std::vector<ChatMessage> &messages,
                          const GenerationParams &params = {});

  LoadState CurrentState() const { return lifecycle_.CurrentState(); }

  const std::shared_ptr<ResourceGovernor> &Governor() const {
    return governor_;
  }
  ModelLifecycleManager &Lifecycle() { return lifecycle_; }
  const EngineOptions &options() const { return options_; }

private:
  EngineOptions options_;
  std::shared_ptr<ResourceGovernor> governor_;
  ModelLifecycleManager lifecycle_;
};

} // namespace hiyo
