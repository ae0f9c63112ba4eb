#include "scheduler/generation_engine.h"

#include "common/logging/logger.h"
#include "common/metrics/metrics.h"

#include <system_error>

namespace hiyo {

GenerationEngine::GenerationEngine(std::shared_ptr<ModelLoader> loader,
                                   EngineOptions options,
                                   std::shared_ptr<const MemoryProbe> probe,
                                   ResourceGovernor::NowFn now)
    : options_(options),
      governor_(std::make_shared<ResourceGovernor>(
          options.governor, std::move(probe), std::move(now))),
      lifecycle_(std::move(loader)) {}

LoadResult GenerationEngine::LoadModel(const std::string &model_id,
                                       const ModelLoader::ProgressFn &progress) {
  return lifecycle_.Load(model_id, progress);
}

void GenerationEngine::UnloadModel() { lifecycle_.Unload(); }

GenerateResult GenerationEngine::Generate(
    const std::vector<ChatMessage> &messages, const GenerationParams &params) {
  GenerateResult result;
  auto fail = [&](GenerationStatus status) {
    log::Warn("engine", "generation rejected",
              std::string("kind=") + ErrorKindName(status.kind) +
                  " code=" + GenerationErrorCodeName(status.code) +
                  " message=" + status.message);
    result.status = std::move(status);
    return std::move(result);
  };

  auto handle = lifecycle_.CurrentHandle();
  if (!handle) {
    return fail(GenerationStatus::Failure(ErrorKind::kGeneration,
                                          GenerationErrorCode::kModelNotLoaded,
                                          "No model loaded."));
  }
  DecodeLease lease = ModelHandle::TryLease(handle);
  if (!lease) {
    return fail(GenerationStatus::Failure(
        ErrorKind::kGeneration, GenerationErrorCode::kBusy,
        "Another generation is running on this model."));
  }

  std::string reason;
  if (!ValidateGenerationParams(params, &reason)) {
    return fail(GenerationStatus::Failure(
        ErrorKind::kValidation, GenerationErrorCode::kInvalidParams, reason));
  }
  if (params.max_tokens > options_.limits.max_tokens_ceiling) {
    log::Info("engine", "max_tokens capped",
              "requested=" + std::to_string(params.max_tokens) +
                  " ceiling=" +
                  std::to_string(options_.limits.max_tokens_ceiling));
  }

  ResourceError admitted = governor_->Admit();
  if (admitted != ResourceError::kNone) {
    return fail(GenerationStatus::Failure(
        ErrorKind::kResource, GenerationErrorCode::kResourceRejected,
        ResourceErrorMessage(admitted), admitted));
  }

  InferenceBackend *backend = handle->backend();
  std::vector<int> tokens = backend->Encode(FormatChatPrompt(messages));
  if (tokens.empty()) {
    return fail(GenerationStatus::Failure(ErrorKind::kValidation,
                                          GenerationErrorCode::kEmptyPrompt,
                                          "Prompt encodes to zero tokens."));
  }

  auto cancel = std::make_shared<std::atomic<bool>>(false);
  auto loop = std::make_unique<DecodeLoop>(backend, std::move(tokens), params,
                                           options_.limits, governor_, cancel);
  int prompt_tokens = loop->PromptTokens();
  ResourceError allocated = governor_->Allocate(prompt_tokens);
  if (allocated != ResourceError::kNone) {
    return fail(GenerationStatus::Failure(
        ErrorKind::kResource, GenerationErrorCode::kResourceRejected,
        ResourceErrorMessage(allocated), allocated));
  }

  GlobalMetrics().RecordGenerationStarted();
  log::Debug("engine", "generation started",
             "model=" + handle->model_id() +
                 " prompt_tokens=" + std::to_string(prompt_tokens) +
                 " max_tokens=" + std::to_string(loop->EffectiveMaxTokens()));

  result.stream = std::make_unique<GenerationStream>(
      handle->model_id(), std::move(lease), std::move(loop), governor_,
      prompt_tokens, cancel, options_.channel_capacity);
  try {
    result.stream->Start();
  } catch (const std::system_error &ex) {
    // The unstarted stream hands back the prompt allocation and the lease.
    result.stream.reset();
    GlobalMetrics().RecordGenerationFailed();
    return fail(GenerationStatus::Failure(
        ErrorKind::kGeneration, GenerationErrorCode::kWorkerStartFailed,
        std::string("Could not start generation: ") + ex.what()));
  }
  return result;
}

} // namespace hiyo
