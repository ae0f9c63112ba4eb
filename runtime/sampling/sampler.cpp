#include "runtime/sampling/sampler.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace hiyo {

namespace {

void CheckLogits(const std::vector<float> &logits) {
  if (logits.empty()) {
    throw std::invalid_argument("sampler: empty logits");
  }
  for (float v : logits) {
    if (!std::isfinite(v)) {
      throw std::invalid_argument("sampler: non-finite logit");
    }
  }
}

int32_t ArgMax(const std::vector<float> &logits) {
  // max_element returns the first maximum, so ties go to the lowest index.
  return static_cast<int32_t>(std::distance(
      logits.begin(), std::max_element(logits.begin(), logits.end())));
}

} // namespace

std::vector<double> Softmax(const std::vector<float> &logits) {
  CheckLogits(logits);
  double max_l = *std::max_element(logits.begin(), logits.end());
  std::vector<double> probs(logits.size());
  double sum_exp = 0.0;
  for (std::size_t i = 0; i < logits.size(); ++i) {
    probs[i] = std::exp(static_cast<double>(logits[i]) - max_l);
    sum_exp += probs[i];
  }
  for (auto &p : probs) {
    p /= sum_exp;
  }
  return probs;
}

std::size_t NucleusKeepCount(const std::vector<double> &sorted_probabilities,
                             float top_p) {
  if (sorted_probabilities.empty()) {
    return 0;
  }
  if (top_p >= 1.0f) {
    return sorted_probabilities.size();
  }
  double before = 0.0;
  for (std::size_t i = 0; i < sorted_probabilities.size(); ++i) {
    if (i > 0 && before > static_cast<double>(top_p)) {
      return i;
    }
    before += sorted_probabilities[i];
  }
  return sorted_probabilities.size();
}

int32_t SampleToken(const std::vector<float> &logits, float temperature,
                    float top_p, std::mt19937 &rng) {
  CheckLogits(logits);

  if (temperature <= 0.0f) {
    return ArgMax(logits);
  }

  // Scale in double so tiny temperatures cannot overflow to inf.
  double max_l = *std::max_element(logits.begin(), logits.end());
  std::vector<double> probs(logits.size());
  double sum_exp = 0.0;
  for (std::size_t i = 0; i < logits.size(); ++i) {
    probs[i] = std::exp((static_cast<double>(logits[i]) - max_l) /
                        static_cast<double>(temperature));
    sum_exp += probs[i];
  }
  for (auto &p : probs) {
    p /= sum_exp;
  }

  std::vector<int32_t> indices(probs.size());
  std::iota(indices.begin(), indices.end(), 0);

  if (top_p < 1.0f) {
    std::stable_sort(indices.begin(), indices.end(),
                     [&](int32_t a, int32_t b) { return probs[a] > probs[b]; });
    std::vector<double> sorted;
    sorted.reserve(indices.size());
    for (int32_t idx : indices) {
      sorted.push_back(probs[idx]);
    }
    indices.resize(NucleusKeepCount(sorted, top_p));
  }

  // discrete_distribution re-normalises the surviving weights.
  std::vector<double> weights;
  weights.reserve(indices.size());
  for (int32_t idx : indices) {
    weights.push_back(probs[idx]);
  }
  std::discrete_distribution<int32_t> dist(weights.begin(), weights.end());
  return indices[static_cast<std::size_t>(dist(rng))];
}

} // namespace hiyo
