#include "scheduler/chat_prompt.h"

namespace hiyo {

std::string FormatChatPrompt(const std::vector<ChatMessage> &messages) {
  std::string out;
  for (std::size_t i = 0; i < messages.size(); ++i) {
    const auto &m = messages[i];
    if (i > 0) {
      out += "\n";
    }
    if (m.role == "system") {
      out += "System: ";
    } else if (m.role == "user") {
      out += "User: ";
    } else if (m.role == "assistant") {
      out += "Assistant: ";
    }
    out += m.content;
  }
  if (out.empty()) {
    return "Assistant:";
  }
  return out + "\nAssistant:";
}

} // namespace hiyo
