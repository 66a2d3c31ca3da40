/**
 * @file threshold_classifier.cpp
 * @brief Threshold classifier implementation.
 * @author oafield developers
 */

#include "oafield/engine/threshold_classifier.hpp"

#include <cmath>

#include "oafield/engine/sample_validator.hpp"

namespace oafield::engine {

bool is_above_threshold(double value, double threshold) noexcept { return value > threshold; }

ThresholdClassification classify_by_threshold(const core::SampleSet& samples, double threshold) {
  ThresholdClassification out{.threshold = threshold};
  if (!std::isfinite(threshold)) {
    out.status = core::Status::InvalidInput;
    return out;
  }
  if (!has_sufficient_samples(samples)) {
    out.status = core::Status::InsufficientData;
    return out;
  }

  for (const auto& s : samples) {
    if (is_above_threshold(s.value, threshold)) {
      out.above.push_back(s);
    } else {
      out.below.push_back(s);
    }
  }
  return out;
}

}  // namespace oafield::engine
