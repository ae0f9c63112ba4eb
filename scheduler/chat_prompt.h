#pragma once

#include <string>
#include <vector>

namespace hiyo {

struct ChatMessage {
  std::string role; // "system", "user", "assistant", or anything else.
  std::string content;
};

// Renders a conversation as plain text for the model:
//
//   System: <content>
//   User: <content>
//   Assistant: <content>
//   Assistant:
//
// Messages with any other role contribute their content verbatim. An empty
// conversation (or one that renders to no text) is just "Assistant:".
std::string FormatChatPrompt(const std::vector<ChatMessage> &messages);

} // namespace hiyo
