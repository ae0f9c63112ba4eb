#pragma once

#include <filesystem>
#include <string>

namespace hiyo {

constexpr std::size_t kMaxModelIdLength = 100;

// Checks a model identifier of the form "owner/name" before it is allowed
// anywhere near the filesystem.
//   owner: [A-Za-z0-9_-]+
//   name:  [A-Za-z0-9._-]+
// Path-traversal and shell metacharacter sequences are rejected even where
// the character classes would allow them (e.g. ".." inside the name).
// Returns false and fills *reason on rejection.
bool ValidateModelId(const std::string &id, std::string *reason = nullptr);

// Directory of a validated id relative to the models directory:
// "owner/name" -> owner/name. One level per component, so distinct ids never
// share a directory.
std::filesystem::path ModelDirectoryPath(const std::string &id);

} // namespace hiyo
