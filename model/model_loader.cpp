#include "model/model_loader.h"

#include "common/logging/logger.h"
#include "model/model_id.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <system_error>
#include <vector>

using json = nlohmann::json;

namespace hiyo {

namespace fs = std::filesystem;

namespace {

// True when `path` is `root` or lies below it. Both must be canonical.
bool IsWithin(const fs::path &path, const fs::path &root) {
  auto rel = path.lexically_relative(root);
  if (rel.empty()) {
    return false;
  }
  auto first = *rel.begin();
  return first != ".." && !rel.is_absolute();
}

} // namespace

LoadedModel LoadedModel::Failure(LoadErrorCode code, std::string message) {
  LoadedModel out;
  out.code = code;
  out.message = std::move(message);
  return out;
}

LoadedModel LoadedModel::Cancelled() {
  LoadedModel out;
  out.cancelled = true;
  out.message = "load cancelled";
  return out;
}

LocalModelLoader::LocalModelLoader(LocalModelLoaderConfig config)
    : config_(std::move(config)) {}

fs::path LocalModelLoader::ResolveModelDirectory(const std::string &model_id,
                                                 LoadErrorCode *code,
                                                 std::string *message) const {
  auto fail = [&](LoadErrorCode c, std::string msg) {
    *code = c;
    *message = std::move(msg);
    return fs::path();
  };

  std::error_code ec;
  auto override_it = config_.directory_overrides.find(model_id);
  if (override_it != config_.directory_overrides.end()) {
    auto dir = fs::canonical(override_it->second, ec);
    if (ec || !fs::is_directory(dir, ec)) {
      return fail(LoadErrorCode::kModelNotFound,
                  "model directory is not accessible: " +
                      override_it->second.string());
    }
    return dir;
  }

  if (config_.models_dir.empty()) {
    return fail(LoadErrorCode::kModelNotFound, "no models directory configured");
  }
  auto root = fs::canonical(config_.models_dir, ec);
  if (ec) {
    return fail(LoadErrorCode::kModelNotFound,
                "models directory is not accessible: " +
                    config_.models_dir.string());
  }
  auto candidate = root / ModelDirectoryPath(model_id);
  auto dir = fs::canonical(candidate, ec);
  if (ec || !fs::is_directory(dir, ec)) {
    return fail(LoadErrorCode::kModelNotFound,
                "model directory is not accessible: " + candidate.string());
  }
  if (!IsWithin(dir, root)) {
    return fail(LoadErrorCode::kLoadFailed,
                "model directory escapes the models directory: " +
                    dir.string());
  }
  return dir;
}

ModelMetadata LocalModelLoader::ParseMetadata(const fs::path &config_path) {
  ModelMetadata meta;
  std::ifstream f(config_path);
  if (!f.is_open()) {
    return meta;
  }

  json j;
  try {
    f >> j;
  } catch (const json::exception &e) {
    log::Warn("model_loader",
              std::string("config.json parse error: ") + e.what());
    return meta;
  }
  if (!j.is_object()) {
    return meta;
  }

  auto get_str = [&](const char *key, std::string &out) {
    if (j.contains(key) && j[key].is_string())
      out = j[key].get<std::string>();
  };
  auto get_int = [&](const char *key, int &out) {
    if (j.contains(key) && j[key].is_number_integer())
      out = j[key].get<int>();
  };

  get_str("model_type", meta.model_type);
  get_int("max_position_embeddings", meta.max_position_embeddings);
  get_int("vocab_size", meta.vocab_size);
  return meta;
}

fs::path LocalModelLoader::FindWeights(const fs::path &dir) {
  std::vector<fs::path> candidates;
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(dir, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".gguf") {
      candidates.push_back(entry.path());
    }
  }
  if (candidates.empty()) {
    return {};
  }
  std::sort(candidates.begin(), candidates.end());
  return candidates.front();
}

LoadedModel LocalModelLoader::Load(const std::string &model_id,
                                   const ProgressFn &progress,
                                   const std::atomic<bool> &cancel) {
  auto report = [&](double p) {
    if (progress) {
      progress(p);
    }
  };

  if (cancel.load()) {
    return LoadedModel::Cancelled();
  }
  if (!config_.allow_list.empty() && !config_.allow_list.count(model_id)) {
    log::Warn("model_loader", "unsupported model id", "id=" + model_id);
    return LoadedModel::Failure(LoadErrorCode::kUnsupportedModel,
                                "The model '" + model_id +
                                    "' is not supported.");
  }

  LoadErrorCode code = LoadErrorCode::kNone;
  std::string message;
  auto dir = ResolveModelDirectory(model_id, &code, &message);
  if (dir.empty()) {
    log::Error("model_loader", message, "id=" + model_id);
    return LoadedModel::Failure(code, message);
  }
  report(0.1);

  LoadedModel out;
  out.metadata = ParseMetadata(dir / "config.json");
  out.weights_path = FindWeights(dir);
  if (out.weights_path.empty()) {
    return LoadedModel::Failure(LoadErrorCode::kLoadFailed,
                                "no .gguf weights in " + dir.string());
  }
  if (cancel.load()) {
    return LoadedModel::Cancelled();
  }
  report(0.4);

  LlamaBackendConfig backend_config = config_.backend;
  if (out.metadata.max_position_embeddings > 0) {
    backend_config.ctx_size =
        std::min(backend_config.ctx_size, out.metadata.max_position_embeddings);
  }

  auto backend = std::make_unique<LlamaBackend>();
  // llama.cpp reports [0, 1]; map it onto [0.4, 0.95].
  bool ok = backend->LoadModel(out.weights_path, backend_config, [&](float f) {
    if (cancel.load()) {
      return false;
    }
    report(0.4 + 0.55 * std::min(1.0, std::max(0.0, static_cast<double>(f))));
    return true;
  });
  if (cancel.load()) {
    return LoadedModel::Cancelled();
  }
  if (!ok) {
    return LoadedModel::Failure(LoadErrorCode::kLoadFailed,
                                "Failed to load model: " +
                                    out.weights_path.filename().string());
  }

  out.ok = true;
  out.backend = std::move(backend);
  report(1.0);
  return out;
}

} // namespace hiyo
