/**
 * @file statistics.hpp
 * @brief Descriptive statistics over a validated sample set.
 * @author oafield developers
 */
#pragma once

#include <cstddef>
#include <vector>

#include "oafield/core/types.hpp"
#include "oafield/engine/threshold_classifier.hpp"

namespace oafield::engine {

/**
 * @brief Summary statistics for one parameter.
 *
 * Threshold counts and fractions are zero unless `has_classification`.
 */
struct StatisticsSummary {
  double mean{};
  double median{};
  double std_dev{};
  double min{};
  double max{};
  std::size_t count{};
  std::size_t above_count{};
  std::size_t below_count{};
  double above_fraction{};
  double below_fraction{};
  bool has_classification{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Arithmetic mean; NaN for an empty input.
 */
[[nodiscard]] double mean(const std::vector<double>& values);

/**
 * @brief Median, averaging the two middle values for even counts; NaN for an empty input.
 */
[[nodiscard]] double median(std::vector<double> values);

/**
 * @brief Sample standard deviation with Bessel's correction; NaN below two values.
 */
[[nodiscard]] double sample_std_dev(const std::vector<double>& values);

/**
 * @brief `count / total`, defined as 0 when `total` is 0.
 */
[[nodiscard]] double class_fraction(std::size_t count, std::size_t total) noexcept;

/**
 * @brief Summarise sample values.
 *
 * Values are reduced in sorted order, so any permutation of `samples` gives
 * an identical summary.
 */
[[nodiscard]] StatisticsSummary summarize(const core::SampleSet& samples);

/**
 * @brief Summarise sample values and the class counts of `classification`.
 * @return Summary with `status` set; a classification that does not cover `samples` is `InvalidInput`.
 */
[[nodiscard]] StatisticsSummary summarize(const core::SampleSet& samples,
                                          const ThresholdClassification& classification);

}  // namespace oafield::engine
