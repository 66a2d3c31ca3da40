/**
 * @file test_classifier.cpp
 * @brief Threshold classifier partition tests.
 * @author oafield developers
 */

#include <algorithm>
#include <limits>

#include <spdlog/spdlog.h>

#include "oafield/engine/threshold_classifier.hpp"

namespace {

bool same_sample(const oafield::core::Sample& a, const oafield::core::Sample& b) {
  return a.lat_deg == b.lat_deg && a.lon_deg == b.lon_deg && a.value == b.value;
}

}  // namespace

int main() {
  using namespace oafield;

  const core::SampleSet samples{
      {.lat_deg = 36.0, .lon_deg = -122.0, .value = 380.0},
      {.lat_deg = 36.1, .lon_deg = -122.1, .value = 400.0},
      {.lat_deg = 36.2, .lon_deg = -122.2, .value = 400.0000001},
      {.lat_deg = 36.3, .lon_deg = -122.3, .value = 650.0},
      {.lat_deg = 36.4, .lon_deg = -122.4, .value = -5.0},
      {.lat_deg = 36.5, .lon_deg = -122.5, .value = 399.9999999},
  };

  const auto c = engine::classify_by_threshold(samples, 400.0);
  if (c.status != core::Status::Ok || c.threshold != 400.0 || c.above.size() != 2U || c.below.size() != 4U) {
    spdlog::error("partition sizes mismatch: {} above {} below", c.above.size(), c.below.size());
    return 1;
  }
  if (!same_sample(c.below[1], samples[1])) {
    spdlog::error("sample at the threshold must be below");
    return 2;
  }
  if (!same_sample(c.above[0], samples[2]) || !same_sample(c.above[1], samples[3]) || !same_sample(c.below[0], samples[0]) ||
      !same_sample(c.below[3], samples[5])) {
    spdlog::error("class order must follow input order");
    return 3;
  }

  // Total and disjoint.
  if (c.total() != samples.size()) {
    spdlog::error("partition is not total");
    return 4;
  }
  for (const auto& s : samples) {
    const auto in_above = std::count_if(c.above.begin(), c.above.end(), [&](const auto& a) { return same_sample(a, s); });
    const auto in_below = std::count_if(c.below.begin(), c.below.end(), [&](const auto& b) { return same_sample(b, s); });
    if (in_above + in_below != 1) {
      spdlog::error("partition is not disjoint");
      return 5;
    }
  }

  const auto all_below = engine::classify_by_threshold(samples, 1000.0);
  const auto all_above = engine::classify_by_threshold(samples, -1000.0);
  if (!all_below.above.empty() || all_below.below.size() != 6U || all_above.above.size() != 6U || !all_above.below.empty()) {
    spdlog::error("extreme thresholds mismatch");
    return 6;
  }
  if (engine::is_above_threshold(1.0, 1.0) || !engine::is_above_threshold(1.0, 0.999)) {
    spdlog::error("threshold comparison mismatch");
    return 7;
  }

  if (engine::classify_by_threshold(samples, std::numeric_limits<double>::quiet_NaN()).status != core::Status::InvalidInput ||
      engine::classify_by_threshold(samples, std::numeric_limits<double>::infinity()).status != core::Status::InvalidInput) {
    spdlog::error("non-finite threshold accepted");
    return 8;
  }
  const core::SampleSet three(samples.begin(), samples.begin() + 3);
  const auto refused = engine::classify_by_threshold(three, 400.0);
  if (refused.status != core::Status::InsufficientData || refused.total() != 0U) {
    spdlog::error("too few samples must be refused");
    return 9;
  }
  return 0;
}
