#pragma once

// Shared utilities used by InferenceBackend implementations and the fakes in
// tests. Keep this header dependency-free: no llama.h.

#include <cstddef>
#include <string>

namespace hiyo {

// Byte length of the UTF-8 sequence introduced by lead byte `c`, or 0 for a
// continuation byte.
inline std::size_t Utf8SequenceLength(unsigned char c) {
  if ((c & 0x80) == 0x00)
    return 1;
  if ((c & 0xE0) == 0xC0)
    return 2;
  if ((c & 0xF0) == 0xE0)
    return 3;
  if ((c & 0xF8) == 0xF0)
    return 4;
  return 0;
}

// True when `text` ends inside a multi-byte UTF-8 sequence, i.e. the last
// lead byte announces more continuation bytes than follow it.
// Stray continuation bytes with no lead byte are treated as complete so a
// malformed piece can never be held back forever.
inline bool EndsWithIncompleteUtf8(const std::string &text) {
  std::size_t n = text.size();
  // A sequence is at most 4 bytes long.
  for (std::size_t back = 1; back <= 4 && back <= n; ++back) {
    unsigned char c = static_cast<unsigned char>(text[n - back]);
    std::size_t len = Utf8SequenceLength(c);
    if (len == 0) {
      continue;
    }
    return len > back;
  }
  return false;
}

} // namespace hiyo
