#include "runtime/generation_params.h"

#include <cmath>

namespace hiyo {

bool ValidateGenerationParams(const GenerationParams &params,
                              std::string *reason) {
  auto fail = [&](const char *msg) {
    if (reason) {
      *reason = msg;
    }
    return false;
  };
  if (!std::isfinite(params.temperature) || params.temperature < 0.0f ||
      params.temperature > 2.0f) {
    return fail("temperature must be in [0, 2]");
  }
  if (!std::isfinite(params.top_p) || params.top_p <= 0.0f ||
      params.top_p > 1.0f) {
    return fail("top_p must be in (0, 1]");
  }
  if (params.max_tokens < 1) {
    return fail("max_tokens must be at least 1");
  }
  return true;
}

} // namespace hiyo
