#pragma once

#include <string>

namespace hiyo {

// Broad failure class of an engine operation. Every class except kNone is
// recoverable by the caller; kCancelled is a normal terminal outcome.
enum class ErrorKind {
  kNone,
  kValidation, // Bad model identifier or generation parameters.
  kLoad,       // Model directory, weight or tokenizer failure.
  kResource,   // Rate limit, memory pressure or token budget.
  kGeneration, // Forward pass or sampling failure.
  kCancelled,
};

// Resource Governor rejections.
enum class ResourceError {
  kNone,
  kRateLimited,
  kContextTooLarge,
  kInvalidTokenCount,
  kMemoryPressure,
};

enum class LoadErrorCode {
  kNone,
  kInvalidIdentifier, // Reported as ErrorKind::kValidation.
  kUnsupportedModel,
  kModelNotFound,
  kLoadFailed,
};

enum class GenerationErrorCode {
  kNone,
  kModelNotLoaded,
  kBusy,          // Another generation holds the model handle.
  kInvalidParams, // Reported as ErrorKind::kValidation.
  kEmptyPrompt,
  kResourceRejected,
  kForwardFailed,
  kSamplingFailed,
  kWorkerStartFailed, // The stream's worker thread could not be created.
};

const char *ErrorKindName(ErrorKind kind);
const char *ResourceErrorName(ResourceError error);
const char *LoadErrorCodeName(LoadErrorCode code);
const char *GenerationErrorCodeName(GenerationErrorCode code);

// User-facing text for a governor rejection.
std::string ResourceErrorMessage(ResourceError error);

// Outcome of a generation, carried in the ok-flag style.
struct GenerationStatus {
  bool ok{true};
  ErrorKind kind{ErrorKind::kNone};
  GenerationErrorCode code{GenerationErrorCode::kNone};
  ResourceError resource{ResourceError::kNone}; // Set when kind == kResource.
  std::string message;

  static GenerationStatus Failure(ErrorKind kind, GenerationErrorCode code,
                                  std::string message,
                                  ResourceError resource = ResourceError::kNone);
};

} // namespace hiyo
