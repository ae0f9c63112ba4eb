#include "model/model_id.h"

#include <array>
#include <cctype>

namespace hiyo {

namespace {

bool IsOwnerChar(unsigned char c) {
  return std::isalnum(c) || c == '_' || c == '-';
}

bool IsNameChar(unsigned char c) { return IsOwnerChar(c) || c == '.'; }

bool Reject(std::string *reason, const char *msg) {
  if (reason) {
    *reason = msg;
  }
  return false;
}

} // namespace

bool ValidateModelId(const std::string &id, std::string *reason) {
  if (id.empty()) {
    return Reject(reason, "model id is empty");
  }
  if (id.size() > kMaxModelIdLength) {
    return Reject(reason, "model id is longer than 100 characters");
  }

  static const std::array<std::string, 10> kBlocked = {
      "..", "../", "./", ":", ";", "|", "&", "$", "`", std::string(1, '\0')};
  for (const auto &seq : kBlocked) {
    if (id.find(seq) != std::string::npos) {
      return Reject(reason, "model id contains a blocked sequence");
    }
  }

  auto slash = id.find('/');
  if (slash == std::string::npos || slash == 0 || slash + 1 == id.size()) {
    return Reject(reason, "model id must have the form owner/name");
  }
  for (std::size_t i = 0; i < slash; ++i) {
    if (!IsOwnerChar(static_cast<unsigned char>(id[i]))) {
      return Reject(reason, "model owner contains an invalid character");
    }
  }
  for (std::size_t i = slash + 1; i < id.size(); ++i) {
    // A second '/' lands here too.
    if (!IsNameChar(static_cast<unsigned char>(id[i]))) {
      return Reject(reason, "model name contains an invalid character");
    }
  }
  return true;
}

std::filesystem::path ModelDirectoryPath(const std::string &id) {
  auto slash = id.find('/');
  if (slash == std::string::npos) {
    return std::filesystem::path(id);
  }
  return std::filesystem::path(id.substr(0, slash)) / id.substr(slash + 1);
}

} // namespace hiyo
