#pragma once

#include <cstdint>
#include <string>

namespace hiyo {

// Sampling and length controls for one generation. Immutable once submitted.
struct GenerationParams {
  float temperature{0.7f}; // 0 = greedy; valid range [0, 2].
  float top_p{0.9f};       // Nucleus threshold; valid range (0, 1].
  int max_tokens{1024};    // >= 1; values above the decode ceiling are capped.
  // RNG seed. UINT32_MAX = seed from std::random_device.
  uint32_t seed{UINT32_MAX};
};

// Returns false and fills *reason when params are outside their valid ranges.
bool ValidateGenerationParams(const GenerationParams &params,
                              std::string *reason);

} // namespace hiyo
