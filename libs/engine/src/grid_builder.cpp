/**
 * @file grid_builder.cpp
 * @brief Grid builder implementation.
 * @author oafield developers
 */

#include "oafield/engine/grid_builder.hpp"

#include <algorithm>
#include <cmath>

#include "oafield/engine/sample_validator.hpp"

namespace oafield::engine {
namespace {

double axis_padding(double span, double padding_fraction) {
  if (span <= 0.0) {
    return core::constants::kMinAbsolutePaddingDeg;
  }
  return span * padding_fraction;
}

}  // namespace

std::vector<double> linspace(double lo, double hi, std::size_t n) {
  std::vector<double> out(n);
  if (n == 0) {
    return out;
  }
  out[0] = lo;
  if (n == 1) {
    return out;
  }
  const double step = (hi - lo) / static_cast<double>(n - 1);
  for (std::size_t i = 1; i + 1 < n; ++i) {
    out[i] = lo + static_cast<double>(i) * step;
  }
  out[n - 1] = hi;
  return out;
}

core::BoundingBox padded_bounds(const core::SampleSet& samples, double padding_fraction) {
  core::BoundingBox box{
      .lat_min = samples.front().lat_deg,
      .lat_max = samples.front().lat_deg,
      .lon_min = samples.front().lon_deg,
      .lon_max = samples.front().lon_deg,
  };
  for (const auto& s : samples) {
    box.lat_min = std::min(box.lat_min, s.lat_deg);
    box.lat_max = std::max(box.lat_max, s.lat_deg);
    box.lon_min = std::min(box.lon_min, s.lon_deg);
    box.lon_max = std::max(box.lon_max, s.lon_deg);
  }

  const double lat_pad = axis_padding(box.lat_span(), padding_fraction);
  const double lon_pad = axis_padding(box.lon_span(), padding_fraction);
  box.lat_min = std::max(box.lat_min - lat_pad, core::constants::kLatMinDeg);
  box.lat_max = std::min(box.lat_max + lat_pad, core::constants::kLatMaxDeg);
  box.lon_min = std::max(box.lon_min - lon_pad, core::constants::kLonMinDeg);
  box.lon_max = std::min(box.lon_max + lon_pad, core::constants::kLonMaxDeg);
  return box;
}

Grid build_grid(const core::SampleSet& samples, const GridSpec& spec) {
  if (spec.resolution == 0 || !std::isfinite(spec.padding_fraction) || spec.padding_fraction < 0.0) {
    return Grid{.status = core::Status::InvalidInput};
  }
  if (!has_sufficient_samples(samples)) {
    return Grid{.status = core::Status::InsufficientData};
  }

  Grid grid{};
  grid.bounds = padded_bounds(samples, spec.padding_fraction);
  grid.latitudes = linspace(grid.bounds.lat_min, grid.bounds.lat_max, spec.resolution);
  grid.longitudes = linspace(grid.bounds.lon_min, grid.bounds.lon_max, spec.resolution);
  return grid;
}

}  // namespace oafield::engine
