#include "common/errors.h"

#include <utility>

namespace hiyo {

const char *ErrorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return "none";
  case ErrorKind::kValidation:
    return "validation";
  case ErrorKind::kLoad:
    return "load";
  case ErrorKind::kResource:
    return "resource";
  case ErrorKind::kGeneration:
    return "generation";
  case ErrorKind::kCancelled:
    return "cancelled";
  }
  return "unknown";
}

const char *ResourceErrorName(ResourceError error) {
  switch (error) {
  case ResourceError::kNone:
    return "none";
  case ResourceError::kRateLimited:
    return "rate_limited";
  case ResourceError::kContextTooLarge:
    return "context_too_large";
  case ResourceError::kInvalidTokenCount:
    return "invalid_token_count";
  case ResourceError::kMemoryPressure:
    return "memory_pressure";
  }
  return "unknown";
}

const char *LoadErrorCodeName(LoadErrorCode code) {
  switch (code) {
  case LoadErrorCode::kNone:
    return "none";
  case LoadErrorCode::kInvalidIdentifier:
    return "invalid_identifier";
  case LoadErrorCode::kUnsupportedModel:
    return "unsupported_model";
  case LoadErrorCode::kModelNotFound:
    return "model_not_found";
  case LoadErrorCode::kLoadFailed:
    return "load_failed";
  }
  return "unknown";
}

const char *GenerationErrorCodeName(GenerationErrorCode code) {
  switch (code) {
  case GenerationErrorCode::kNone:
    return "none";
  case GenerationErrorCode::kModelNotLoaded:
    return "model_not_loaded";
  case GenerationErrorCode::kBusy:
    return "busy";
  case GenerationErrorCode::kInvalidParams:
    return "invalid_params";
  case GenerationErrorCode::kEmptyPrompt:
    return "empty_prompt";
  case GenerationErrorCode::kResourceRejected:
    return "resource_rejected";
  case GenerationErrorCode::kForwardFailed:
    return "forward_failed";
  case GenerationErrorCode::kSamplingFailed:
    return "sampling_failed";
  case GenerationErrorCode::kWorkerStartFailed:
    return "worker_start_failed";
  }
  return "unknown";
}

std::string ResourceErrorMessage(ResourceError error) {
  switch (error) {
  case ResourceError::kNone:
    return {};
  case ResourceError::kRateLimited:
    return "Too many requests. Wait a moment and try again.";
  case ResourceError::kContextTooLarge:
    return "Context window exceeded. Start a new conversation.";
  case ResourceError::kInvalidTokenCount:
    return "Invalid token count.";
  case ResourceError::kMemoryPressure:
    return "System memory limit exceeded. Close other apps and try again.";
  }
  return "Unknown resource error.";
}

GenerationStatus GenerationStatus::Failure(ErrorKind kind,
                                           GenerationErrorCode code,
                                           std::string message,
                                           ResourceError resource) {
  GenerationStatus status;
  status.ok = false;
  status.kind = kind;
  status.code = code;
  status.resource = resource;
  status.message = std::move(message);
  return status;
}

} // namespace hiyo
