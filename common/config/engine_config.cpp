#include "common/config/engine_config.h"

#include "common/logging/logger.h"

#include <yaml-cpp/yaml.h>

#include <cstdlib>

namespace hiyo {

namespace fs = std::filesystem;

namespace {

void ParseNode(const YAML::Node &config, EngineConfig *out) {
  if (config["engine"]) {
    const auto &engine = config["engine"];
    if (engine["context_ceiling"])
      out->limits.context_ceiling = engine["context_ceiling"].as<int>();
    if (engine["max_tokens_ceiling"])
      out->limits.max_tokens_ceiling = engine["max_tokens_ceiling"].as<int>();
    if (engine["channel_capacity"])
      out->channel_capacity = engine["channel_capacity"].as<std::size_t>();
  }

  if (config["governor"]) {
    const auto &gov = config["governor"];
    if (gov["max_requests_per_second"])
      out->governor.max_requests_per_second =
          gov["max_requests_per_second"].as<int>();
    if (gov["max_requests_per_minute"])
      out->governor.max_requests_per_minute =
          gov["max_requests_per_minute"].as<int>();
    if (gov["memory_fraction"])
      out->governor.memory_fraction = gov["memory_fraction"].as<double>();
    if (gov["max_tokens_per_call"])
      out->governor.max_tokens_per_call = gov["max_tokens_per_call"].as<int>();
    if (gov["max_active_tokens"])
      out->governor.max_active_tokens = gov["max_active_tokens"].as<int>();
  }

  if (config["models"] && config["models"].IsMap()) {
    const auto &models = config["models"];
    if (models["dir"])
      out->models.dir = models["dir"].as<std::string>();
    if (models["catalog"])
      out->models.catalog = models["catalog"].as<std::string>();
    if (models["restrict_to_catalog"])
      out->models.restrict_to_catalog = models["restrict_to_catalog"].as<bool>();
    if (models["default"])
      out->models.default_model = models["default"].as<std::string>();
    if (models["gpu_layers"])
      out->models.backend.gpu_layers = models["gpu_layers"].as<int>();
    if (models["ctx_size"])
      out->models.backend.ctx_size = models["ctx_size"].as<int>();
    if (models["batch_size"])
      out->models.backend.batch_size = models["batch_size"].as<int>();
  }

  if (config["logging"]) {
    if (config["logging"]["format"])
      out->logging.format = config["logging"]["format"].as<std::string>();
    if (config["logging"]["level"])
      out->logging.level = config["logging"]["level"].as<std::string>();
  }

  if (config["generation"]) {
    const auto &gen = config["generation"];
    if (gen["temperature"])
      out->generation.temperature = gen["temperature"].as<float>();
    if (gen["top_p"])
      out->generation.top_p = gen["top_p"].as<float>();
    if (gen["max_tokens"])
      out->generation.max_tokens = gen["max_tokens"].as<int>();
    if (gen["seed"])
      out->generation.seed = gen["seed"].as<uint32_t>();
  }
}

} // namespace

fs::path HiyoHome() {
  if (const char *env = std::getenv("HIYO_HOME")) {
    return fs::path(env);
  }
  if (const char *home = std::getenv("HOME")) {
    return fs::path(home) / ".hiyo";
  }
  return fs::current_path() / ".hiyo";
}

fs::path DefaultConfigPath() { return HiyoHome() / "config.yaml"; }

EngineConfig ParseEngineConfig(const std::string &yaml_text, bool *ok) {
  EngineConfig config;
  if (ok) {
    *ok = true;
  }
  try {
    ParseNode(YAML::Load(yaml_text), &config);
  } catch (const YAML::Exception &e) {
    log::Error("config", std::string("config parse error: ") + e.what());
    if (ok) {
      *ok = false;
    }
  }
  if (config.models.dir.empty()) {
    config.models.dir = HiyoHome() / "models";
  }
  return config;
}

EngineConfig LoadEngineConfig(const fs::path &path, bool *ok) {
  EngineConfig config;
  if (ok) {
    *ok = true;
  }
  if (!path.empty() && fs::exists(path)) {
    try {
      ParseNode(YAML::LoadFile(path.string()), &config);
    } catch (const YAML::Exception &e) {
      log::Error("config", std::string("error parsing config file ") +
                               path.string() + ": " + e.what());
      if (ok) {
        *ok = false;
      }
    }
    auto base = path.parent_path();
    if (!config.models.dir.empty() && config.models.dir.is_relative()) {
      config.models.dir = base / config.models.dir;
    }
    if (!config.models.catalog.empty() && config.models.catalog.is_relative()) {
      config.models.catalog = base / config.models.catalog;
    }
  } else if (!path.empty()) {
    log::Debug("config", "no config file, using defaults",
               "path=" + path.string());
  }
  if (config.models.dir.empty()) {
    config.models.dir = HiyoHome() / "models";
  }
  return config;
}

void ApplyEnvOverrides(EngineConfig *config) {
  if (const char *env_dir = std::getenv("HIYO_MODELS_DIR")) {
    config->models.dir = env_dir;
  }
  if (const char *env_model = std::getenv("HIYO_DEFAULT_MODEL")) {
    config->models.default_model = env_model;
  }
  if (const char *env_format = std::getenv("HIYO_LOG_FORMAT")) {
    config->logging.format = env_format;
  }
  if (const char *env_level = std::getenv("HIYO_LOG_LEVEL")) {
    config->logging.level = env_level;
  }
}

} // namespace hiyo
