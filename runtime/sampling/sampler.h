#pragma once

#include <cstdint>
#include <random>
#include <vector>

namespace hiyo {

// Numerically stable softmax in double precision.
// Throws std::invalid_argument when logits is empty or holds a non-finite
// value.
std::vector<double> Softmax(const std::vector<float> &logits);

// Number of tokens that survive the nucleus filter when `probabilities` is
// already sorted in descending order. A token is dropped when the cumulative
// probability of the tokens ranked above it exceeds top_p. Always >= 1 for a
// non-empty input; top_p >= 1 keeps everything.
std::size_t NucleusKeepCount(const std::vector<double> &sorted_probabilities,
                             float top_p);

// Pick the next token id from one row of logits.
//   temperature <= 0  -> arg-max (lowest index on ties), rng untouched
//   temperature != 1  -> logits / temperature
//   top_p < 1         -> nucleus filter over a stable descending sort
// Holds no state between calls.
int32_t SampleToken(const std::vector<float> &logits, float temperature,
                    float top_p, std::mt19937 &rng);

} // namespace hiyo
