#pragma once

#include "runtime/backends/llama/llama_backend.h"
#include "runtime/decode/decode_loop.h"
#include "runtime/generation_params.h"
#include "scheduler/resource_governor.h"

#include <filesystem>
#include <string>

namespace hiyo {

struct ModelsConfig {
  std::filesystem::path dir;     // Empty = <home>/models.
  std::filesystem::path catalog; // Optional YAML catalog override.
  bool restrict_to_catalog{false};
  std::string default_model;
  LlamaBackendConfig backend;
};

struct LoggingConfig {
  std::string format{"text"}; // "text" or "json".
  std::string level{"info"};
};

// Everything read from config.yaml:
//
//   engine:     { context_ceiling, max_tokens_ceiling, channel_capacity }
//   governor:   { max_requests_per_second, max_requests_per_minute,
//                 memory_fraction, max_tokens_per_call, max_active_tokens }
//   models:     { dir, catalog, restrict_to_catalog, default, gpu_layers,
//                 ctx_size, batch_size }
//   logging:    { format, level }
//   generation: { temperature, top_p, max_tokens, seed }
struct EngineConfig {
  DecodeLimits limits;
  std::size_t channel_capacity{64};
  GovernorConfig governor;
  ModelsConfig models;
  LoggingConfig logging;
  GenerationParams generation;
};

// $HIYO_HOME, else ~/.hiyo, else ./.hiyo.
std::filesystem::path HiyoHome();
std::filesystem::path DefaultConfigPath();

// Missing file: defaults. Malformed file: error logged, *ok = false, and the
// values parsed before the error are kept. models.dir defaults to
// <HiyoHome()>/models; a relative dir resolves against the config file's
// directory.
EngineConfig LoadEngineConfig(const std::filesystem::path &path,
                              bool *ok = nullptr);
EngineConfig ParseEngineConfig(const std::string &yaml_text,
                               bool *ok = nullptr);

// HIYO_MODELS_DIR, HIYO_DEFAULT_MODEL, HIYO_LOG_FORMAT, HIYO_LOG_LEVEL.
void ApplyEnvOverrides(EngineConfig *config);

} // namespace hiyo
