#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hiyo {

// ── Catalog entry ───────────────────────────────────────────────────────────
struct CatalogModel {
  std::string id; // "owner/name"
  std::string name;
  std::string description;
  std::string size;       // Display size, e.g. "1.9 GB".
  std::string parameters; // Display parameter count, e.g. "3B".
  std::vector<std::string> tags;
  // Explicit weights directory. Empty = <models_dir>/<owner>/<name>.
  std::string path;
};

// ── ModelCatalog ────────────────────────────────────────────────────────────
// Curated list of recommended models. Starts with the built-in defaults;
// LoadFile() replaces them with the `models:` sequence of a YAML file:
//
//   models:
//     - id: mlx-community/Llama-3.2-3B-Instruct-4bit
//       name: Llama 3.2 3B
//       description: Fast and capable.
//       size: 1.9 GB
//       parameters: 3B
//       tags: [recommended, balanced]
//       path: /opt/models/llama-3.2-3b   # optional
//
// Entries with an invalid id are skipped with a warning.
class ModelCatalog {
public:
  ModelCatalog();

  static std::vector<CatalogModel> DefaultModels();

  // Returns false (catalog unchanged) on I/O or parse error.
  bool LoadFile(const std::filesystem::path &path);
  bool LoadYaml(const std::string &yaml_text);

  std::optional<CatalogModel> Find(const std::string &id) const;
  std::vector<CatalogModel> Tagged(const std::string &tag) const;
  std::vector<std::string> Ids() const;
  const std::vector<CatalogModel> &Models() const { return models_; }
  bool Contains(const std::string &id) const { return Find(id).has_value(); }

private:
  std::vector<CatalogModel> models_;
};

} // namespace hiyo
