/**
 * @file interpolator.hpp
 * @brief Scattered-data interpolation interface.
 * @author oafield developers
 */
#pragma once

#include <cstdint>

#include "oafield/core/types.hpp"
#include "oafield/engine/field.hpp"
#include "oafield/engine/grid_builder.hpp"

namespace oafield::engine {

/**
 * @brief Scattered-data interpolation scheme identifier.
 */
enum class InterpolationMethod : std::uint8_t { CloughTocher };

/**
 * @brief Interface for scatter-to-grid interpolation schemes.
 */
class IScatterInterpolator {
 public:
  virtual ~IScatterInterpolator() = default;
  /**
   * @brief Scheme implemented by this interpolator.
   */
  [[nodiscard]] virtual InterpolationMethod method() const noexcept = 0;
  /**
   * @brief Estimate the field at every node of `grid`.
   * @param samples Validated sample set.
   * @param grid Evaluation grid built from the same samples.
   * @return Field with `status` set; never extrapolates beyond the samples' convex hull.
   */
  [[nodiscard]] virtual Field interpolate(const core::SampleSet& samples, const Grid& grid) const = 0;
};

}  // namespace oafield::engine
