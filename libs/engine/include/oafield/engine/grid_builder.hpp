/**
 * @file grid_builder.hpp
 * @brief Padded bounding box and regular evaluation grid construction.
 * @author oafield developers
 */
#pragma once

#include <cstddef>
#include <vector>

#include "oafield/core/constants.hpp"
#include "oafield/core/types.hpp"

namespace oafield::engine {

/**
 * @brief Grid construction parameters.
 */
struct GridSpec {
  std::size_t resolution{core::constants::kDefaultGridResolution};
  double padding_fraction{core::constants::kDefaultPaddingFraction};
};

/**
 * @brief Regular `n x n` lattice over a padded bounding box.
 *
 * Node `(i, j)` sits at `latitudes[i]`, `longitudes[j]`; both axes ascend.
 */
struct Grid {
  core::BoundingBox bounds{};
  std::vector<double> latitudes{};
  std::vector<double> longitudes{};
  core::Status status{core::Status::Ok};

  [[nodiscard]] std::size_t rows() const noexcept { return latitudes.size(); }
  [[nodiscard]] std::size_t cols() const noexcept { return longitudes.size(); }
  [[nodiscard]] std::size_t node_count() const noexcept { return rows() * cols(); }
  [[nodiscard]] core::GeoPoint node(std::size_t i, std::size_t j) const {
    return core::GeoPoint{.lat_deg = latitudes[i], .lon_deg = longitudes[j]};
  }
};

/**
 * @brief `n` evenly spaced values from `lo` to `hi`, both included.
 */
[[nodiscard]] std::vector<double> linspace(double lo, double hi, std::size_t n);

/**
 * @brief Sample extent expanded by `padding_fraction` of each axis span.
 *
 * A zero span is padded by `constants::kMinAbsolutePaddingDeg` instead, and
 * the result is clamped to valid latitude/longitude ranges.
 * @note `samples` must be non-empty.
 */
[[nodiscard]] core::BoundingBox padded_bounds(const core::SampleSet& samples, double padding_fraction);

/**
 * @brief Build the evaluation grid for a validated sample set.
 * @return Grid with `status` set; no nodes unless `status` is `Ok`.
 */
[[nodiscard]] Grid build_grid(const core::SampleSet& samples, const GridSpec& spec);

}  // namespace oafield::engine
