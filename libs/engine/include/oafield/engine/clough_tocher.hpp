/**
 * @file clough_tocher.hpp
 * @brief Piecewise-cubic C1 (Clough-Tocher) scattered interpolation.
 * @author oafield developers
 */
#pragma once

#include <array>
#include <vector>

#include <Eigen/Dense>

#include "oafield/engine/interpolator.hpp"
#include "oafield/engine/triangulation.hpp"

namespace oafield::engine {

/**
 * @brief Clough-Tocher surface fitted to one sample set.
 *
 * Samples sharing identical coordinates are merged into one site carrying
 * their mean value. Vertex gradients come from the global curvature
 * minimisation of Nielson; each Delaunay triangle is split at its centroid
 * into three cubic Bezier patches joined with C1 continuity.
 */
class CloughTocherSurface {
 public:
  /**
   * @brief Gradient estimation controls.
   */
  struct Options {
    int max_iterations{400};
    double tolerance{1e-6};
  };

  static CloughTocherSurface fit(const core::SampleSet& samples, const Options& options);
  static CloughTocherSurface fit(const core::SampleSet& samples) { return fit(samples, Options{}); }

  /**
   * @brief Evaluate at a location; NaN outside the convex hull.
   */
  [[nodiscard]] double evaluate(double lat_deg, double lon_deg) const;
  /**
   * @brief Evaluate, reusing and updating a point-location hint.
   */
  [[nodiscard]] double evaluate(double lat_deg, double lon_deg, int& hint) const;

  [[nodiscard]] const Triangulation& triangulation() const noexcept { return mesh_; }
  [[nodiscard]] const std::vector<double>& site_values() const noexcept { return values_; }
  [[nodiscard]] const std::vector<Eigen::Vector2d>& gradients() const noexcept { return gradients_; }
  [[nodiscard]] int gradient_iterations() const noexcept { return iterations_; }
  [[nodiscard]] bool gradients_converged() const noexcept { return converged_; }

 private:
  void estimate_gradients(const Options& options);
  [[nodiscard]] double evaluate_patch(int t, const std::array<double, 3>& b) const;

  Triangulation mesh_{};
  std::vector<double> values_{};
  std::vector<Eigen::Vector2d> gradients_{};
  int iterations_{};
  bool converged_{true};
};

/**
 * @brief Field interpolator backed by `CloughTocherSurface`.
 */
class CloughTocherInterpolator final : public IScatterInterpolator {
 public:
  CloughTocherInterpolator() = default;
  explicit CloughTocherInterpolator(CloughTocherSurface::Options options) : options_(options) {}

  [[nodiscard]] InterpolationMethod method() const noexcept override { return InterpolationMethod::CloughTocher; }
  [[nodiscard]] Field interpolate(const core::SampleSet& samples, const Grid& grid) const override;

 private:
  CloughTocherSurface::Options options_{};
};

}  // namespace oafield::engine
