/**
 * @file threshold_classifier.hpp
 * @brief Above/below threshold partition of a sample set.
 * @author oafield developers
 */
#pragma once

#include <cstddef>

#include "oafield/core/types.hpp"

namespace oafield::engine {

/**
 * @brief Total, disjoint partition of a sample set around a threshold.
 */
struct ThresholdClassification {
  double threshold{};
  core::SampleSet above{};
  core::SampleSet below{};
  core::Status status{core::Status::Ok};

  [[nodiscard]] std::size_t total() const noexcept { return above.size() + below.size(); }
};

/**
 * @brief `value > threshold` is above, `value <= threshold` is below.
 *
 * A sample exactly at the threshold is below. Input order is preserved
 * within each class.
 */
[[nodiscard]] bool is_above_threshold(double value, double threshold) noexcept;

/**
 * @brief Partition validated samples.
 * @return Classification with `status` set; a non-finite threshold is `InvalidInput`.
 */
[[nodiscard]] ThresholdClassification classify_by_threshold(const core::SampleSet& samples, double threshold);

}  // namespace oafield::engine
