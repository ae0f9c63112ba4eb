#include "model/model_catalog.h"

#include "common/logging/logger.h"
#include "model/model_id.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace hiyo {

ModelCatalog::ModelCatalog() : models_(DefaultModels()) {}

std::vector<CatalogModel> ModelCatalog::DefaultModels() {
  return {
      {"mlx-community/Llama-3.2-1B-Instruct-4bit",
       "Llama 3.2 1B",
       "Ultra-fast, minimal memory usage. Great for quick tasks.",
       "0.7 GB",
       "1B",
       {"fast", "efficient", "beginner"},
       {}},
      {"mlx-community/Llama-3.2-3B-Instruct-4bit",
       "Llama 3.2 3B",
       "Fast and capable. Best balance of speed and quality.",
       "1.9 GB",
       "3B",
       {"recommended", "balanced", "general"},
       {}},
      {"mlx-community/Mistral-7B-Instruct-v0.3-4bit",
       "Mistral 7B",
       "High quality reasoning and instruction following.",
       "4.1 GB",
       "7B",
       {"advanced", "reasoning", "powerful"},
       {}},
      {"mlx-community/Phi-3-mini-4k-instruct-4bit",
       "Phi-3 Mini",
       "Microsoft's efficient small model. Strong performance.",
       "1.8 GB",
       "3.8B",
       {"efficient", "microsoft", "quality"},
       {}},
      {"mlx-community/Qwen2.5-7B-Instruct-4bit",
       "Qwen 2.5 7B",
       "Strong multilingual capabilities and coding.",
       "4.2 GB",
       "7B",
       {"multilingual", "coding", "advanced"},
       {}},
      {"mlx-community/CodeLlama-7B-Instruct-4bit",
       "CodeLlama 7B",
       "Optimized for code generation and technical tasks.",
       "4.1 GB",
       "7B",
       {"coding", "technical", "developer"},
       {}},
  };
}

bool ModelCatalog::LoadFile(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in) {
    log::Error("model_catalog", "cannot open catalog file",
               "path=" + path.string());
    return false;
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return LoadYaml(buf.str());
}

bool ModelCatalog::LoadYaml(const std::string &yaml_text) {
  std::vector<CatalogModel> parsed;
  try {
    YAML::Node root = YAML::Load(yaml_text);
    if (!root["models"] || !root["models"].IsSequence()) {
      log::Warn("model_catalog", "catalog yaml has no 'models' sequence");
      return false;
    }
    for (const auto &node : root["models"]) {
      CatalogModel m;
      if (node["id"])
        m.id = node["id"].as<std::string>();
      std::string reason;
      if (!ValidateModelId(m.id, &reason)) {
        log::Warn("model_catalog", "skipping catalog entry",
                  "id=" + m.id + " reason=" + reason);
        continue;
      }
      m.name = node["name"] ? node["name"].as<std::string>() : m.id;
      if (node["description"])
        m.description = node["description"].as<std::string>();
      if (node["size"])
        m.size = node["size"].as<std::string>();
      if (node["parameters"])
        m.parameters = node["parameters"].as<std::string>();
      if (node["tags"] && node["tags"].IsSequence()) {
        for (const auto &tag : node["tags"]) {
          m.tags.push_back(tag.as<std::string>());
        }
      }
      if (node["path"])
        m.path = node["path"].as<std::string>();
      parsed.push_back(std::move(m));
    }
  } catch (const YAML::Exception &ex) {
    log::Error("model_catalog", std::string("YAML parse error: ") + ex.what());
    return false;
  }
  models_ = std::move(parsed);
  log::Info("model_catalog", "catalog loaded",
            "models=" + std::to_string(models_.size()));
  return true;
}

std::optional<CatalogModel> ModelCatalog::Find(const std::string &id) const {
  auto it = std::find_if(models_.begin(), models_.end(),
                         [&](const CatalogModel &m) { return m.id == id; });
  if (it == models_.end()) {
    return std::nullopt;
  }
  return *it;
}

std::vector<CatalogModel> ModelCatalog::Tagged(const std::string &tag) const {
  std::vector<CatalogModel> out;
  for (const auto &m : models_) {
    if (std::find(m.tags.begin(), m.tags.end(), tag) != m.tags.end()) {
      out.push_back(m);
    }
  }
  return out;
}

std::vector<std::string> ModelCatalog::Ids() const {
  std::vector<std::string> ids;
  ids.reserve(models_.size());
  for (const auto &m : models_) {
    ids.push_back(m.id);
  }
  return ids;
}

} // namespace hiyo
