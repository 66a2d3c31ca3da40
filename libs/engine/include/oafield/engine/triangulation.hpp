/**
 * @file triangulation.hpp
 * @brief Planar Delaunay triangulation with point location.
 * @author oafield developers
 */
#pragma once

#include <array>
#include <cstddef>
#include <vector>

#include <Eigen/Dense>

namespace oafield::engine {

/**
 * @brief Planar site; the interpolator maps longitude to `x` and latitude to `y`.
 */
struct PlanarPoint {
  double x{};
  double y{};
};

/**
 * @brief Delaunay triangulation of a planar point set.
 *
 * Triangles are counter-clockwise. `neighbors()[t][k]` is the triangle across
 * the edge opposite vertex `k` of triangle `t`, or -1 on the convex hull.
 * Duplicate sites are kept as coplanar points and not referenced by any
 * triangle. Fewer than three distinct sites, or all sites collinear, yields an
 * empty triangulation.
 */
class Triangulation {
 public:
  using Triangle = std::array<int, 3>;

  /**
   * @brief Triangulate `sites` with Qhull (`d Qbb Qc Qz Q12 Qt`).
   */
  static Triangulation build(std::vector<PlanarPoint> sites);

  [[nodiscard]] bool empty() const noexcept { return triangles_.empty(); }
  [[nodiscard]] std::size_t site_count() const noexcept { return sites_.size(); }
  [[nodiscard]] std::size_t triangle_count() const noexcept { return triangles_.size(); }
  [[nodiscard]] const std::vector<PlanarPoint>& sites() const noexcept { return sites_; }
  [[nodiscard]] const std::vector<Triangle>& triangles() const noexcept { return triangles_; }
  [[nodiscard]] const std::vector<Triangle>& neighbors() const noexcept { return neighbors_; }

  /**
   * @brief Find the triangle containing `p`.
   * @param p Query point.
   * @param hint Triangle to start the directed walk from.
   * @return Triangle index, or -1 when `p` lies outside the convex hull.
   */
  [[nodiscard]] int locate(const PlanarPoint& p, int hint = 0) const;

  /**
   * @brief Barycentric coordinates of `p` relative to triangle `t`.
   */
  [[nodiscard]] std::array<double, 3> barycentric(int t, const PlanarPoint& p) const;

  /**
   * @brief Centroid of triangle `t`.
   */
  [[nodiscard]] PlanarPoint centroid(int t) const;

  /**
   * @brief Sorted, unique edge-adjacent sites of every site.
   */
  [[nodiscard]] std::vector<std::vector<int>> vertex_neighbors() const;

 private:
  struct AffineTransform {
    Eigen::Matrix2d inverse{Eigen::Matrix2d::Zero()};
    PlanarPoint origin{};
    bool valid{};
  };

  [[nodiscard]] bool contains(int t, const PlanarPoint& p) const;

  std::vector<PlanarPoint> sites_{};
  std::vector<Triangle> triangles_{};
  std::vector<Triangle> neighbors_{};
  std::vector<AffineTransform> transforms_{};
};

}  // namespace oafield::engine
