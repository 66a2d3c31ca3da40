/**
 * @file statistics.cpp
 * @brief Statistics summarizer implementation.
 * @author oafield developers
 */

#include "oafield/engine/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <Eigen/Dense>

#include "oafield/engine/sample_validator.hpp"

namespace oafield::engine {
namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Owning copy so reductions always see Eigen-aligned storage and sum in the
// same order for equal inputs.
Eigen::VectorXd as_vector(const std::vector<double>& values) {
  return Eigen::Map<const Eigen::VectorXd>(values.data(), static_cast<Eigen::Index>(values.size()));
}

// Median of an already sorted vector.
double sorted_median(const std::vector<double>& sorted) {
  if (sorted.empty()) {
    return kNaN;
  }
  const std::size_t mid = sorted.size() / 2;
  if (sorted.size() % 2 == 1) {
    return sorted[mid];
  }
  return 0.5 * (sorted[mid - 1] + sorted[mid]);
}

std::vector<double> sorted_values(const core::SampleSet& samples) {
  std::vector<double> values;
  values.reserve(samples.size());
  for (const auto& s : samples) {
    values.push_back(s.value);
  }
  std::sort(values.begin(), values.end());
  return values;
}

}  // namespace

double mean(const std::vector<double>& values) {
  if (values.empty()) {
    return kNaN;
  }
  return as_vector(values).mean();
}

double median(std::vector<double> values) {
  std::sort(values.begin(), values.end());
  return sorted_median(values);
}

double sample_std_dev(const std::vector<double>& values) {
  if (values.size() < 2) {
    return kNaN;
  }
  const auto v = as_vector(values);
  const double mu = v.mean();
  const double ss = (v.array() - mu).square().sum();
  return std::sqrt(ss / static_cast<double>(values.size() - 1));
}

double class_fraction(std::size_t count, std::size_t total) noexcept {
  if (total == 0) {
    return 0.0;
  }
  return static_cast<double>(count) / static_cast<double>(total);
}

StatisticsSummary summarize(const core::SampleSet& samples) {
  StatisticsSummary out{.count = samples.size()};
  if (!has_sufficient_samples(samples)) {
    out.status = core::Status::InsufficientData;
    return out;
  }

  const auto values = sorted_values(samples);
  const auto v = as_vector(values);
  out.mean = mean(values);
  out.median = sorted_median(values);
  out.std_dev = sample_std_dev(values);
  out.min = v.minCoeff();
  out.max = v.maxCoeff();
  return out;
}

StatisticsSummary summarize(const core::SampleSet& samples, const ThresholdClassification& classification) {
  if (classification.status != core::Status::Ok) {
    StatisticsSummary out{.count = samples.size()};
    out.status = classification.status;
    return out;
  }
  if (classification.total() != samples.size()) {
    StatisticsSummary out{.count = samples.size()};
    out.status = core::Status::InvalidInput;
    return out;
  }

  auto out = summarize(samples);
  if (out.status != core::Status::Ok) {
    return out;
  }
  out.has_classification = true;
  out.above_count = classification.above.size();
  out.below_count = classification.below.size();
  out.above_fraction = class_fraction(out.above_count, out.count);
  out.below_fraction = class_fraction(out.below_count, out.count);
  return out;
}

}  // namespace oafield::engine
