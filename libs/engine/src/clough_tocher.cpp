/**
 * @file clough_tocher.cpp
 * @brief Clough-Tocher interpolation implementation.
 * @author oafield developers
 */

#include "oafield/engine/clough_tocher.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <utility>

#include "oafield/engine/sample_validator.hpp"

namespace oafield::engine {
namespace {

// Cross-edge derivative direction used on hull edges (toward the centroid).
constexpr double kHullEdgeDirection = -0.5;

struct MergedSites {
  std::vector<PlanarPoint> points{};
  std::vector<double> values{};
};

MergedSites merge_coincident(const core::SampleSet& samples) {
  core::SampleSet sorted(samples);
  std::sort(sorted.begin(), sorted.end(), [](const core::Sample& a, const core::Sample& b) {
    return (a.lon_deg < b.lon_deg) || (a.lon_deg == b.lon_deg && a.lat_deg < b.lat_deg) ||
           (a.lon_deg == b.lon_deg && a.lat_deg == b.lat_deg && a.value < b.value);
  });

  MergedSites out;
  std::size_t i = 0;
  while (i < sorted.size()) {
    std::size_t j = i;
    double sum = 0.0;
    while (j < sorted.size() && sorted[j].lon_deg == sorted[i].lon_deg && sorted[j].lat_deg == sorted[i].lat_deg) {
      sum += sorted[j].value;
      ++j;
    }
    out.points.push_back(PlanarPoint{.x = sorted[i].lon_deg, .y = sorted[i].lat_deg});
    out.values.push_back(sum / static_cast<double>(j - i));
    i = j;
  }
  return out;
}

}  // namespace

CloughTocherSurface CloughTocherSurface::fit(const core::SampleSet& samples, const Options& options) {
  auto merged = merge_coincident(samples);
  CloughTocherSurface surface;
  surface.mesh_ = Triangulation::build(std::move(merged.points));
  surface.values_ = std::move(merged.values);
  surface.estimate_gradients(options);
  return surface;
}

void CloughTocherSurface::estimate_gradients(const Options& options) {
  const auto& sites = mesh_.sites();
  gradients_.assign(sites.size(), Eigen::Vector2d::Zero());
  iterations_ = 0;
  converged_ = true;
  if (mesh_.empty()) {
    return;
  }

  const auto neighbors = mesh_.vertex_neighbors();
  converged_ = false;
  for (int iter = 0; iter < options.max_iterations; ++iter) {
    double err = 0.0;
    for (std::size_t i = 0; i < sites.size(); ++i) {
      if (neighbors[i].empty()) {
        continue;
      }
      // Minimise the summed squared second derivative of the edge cubics
      // around site i with the neighbours' gradients held fixed.
      Eigen::Matrix2d q = Eigen::Matrix2d::Zero();
      Eigen::Vector2d s = Eigen::Vector2d::Zero();
      for (const int nb : neighbors[i]) {
        const auto j = static_cast<std::size_t>(nb);
        const Eigen::Vector2d e(sites[j].x - sites[i].x, sites[j].y - sites[i].y);
        const double len = e.norm();
        const double l3 = len * len * len;
        const double df2 = -e.dot(gradients_[j]);
        q += (4.0 / l3) * (e * e.transpose());
        s += ((6.0 * (values_[i] - values_[j]) - 2.0 * df2) / l3) * e;
      }
      const double det = q.determinant();
      if (!std::isfinite(det) || det == 0.0) {
        continue;
      }
      const Eigen::Vector2d r = q.inverse() * s;
      double change = (gradients_[i] + r).cwiseAbs().maxCoeff();
      gradients_[i] = -r;
      change /= std::max(1.0, r.cwiseAbs().maxCoeff());
      err = std::max(err, change);
    }
    iterations_ = iter + 1;
    if (err < options.tolerance) {
      converged_ = true;
      break;
    }
  }
}

double CloughTocherSurface::evaluate(double lat_deg, double lon_deg) const {
  int hint = 0;
  return evaluate(lat_deg, lon_deg, hint);
}

double CloughTocherSurface::evaluate(double lat_deg, double lon_deg, int& hint) const {
  const PlanarPoint p{.x = lon_deg, .y = lat_deg};
  const int t = mesh_.locate(p, hint);
  if (t < 0) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  hint = t;
  return evaluate_patch(t, mesh_.barycentric(t, p));
}

double CloughTocherSurface::evaluate_patch(int t, const std::array<double, 3>& b) const {
  const auto& tri = mesh_.triangles()[static_cast<std::size_t>(t)];
  const auto& sites = mesh_.sites();
  const auto v1 = static_cast<std::size_t>(tri[0]);
  const auto v2 = static_cast<std::size_t>(tri[1]);
  const auto v3 = static_cast<std::size_t>(tri[2]);

  const Eigen::Vector2d e12(sites[v2].x - sites[v1].x, sites[v2].y - sites[v1].y);
  const Eigen::Vector2d e23(sites[v3].x - sites[v2].x, sites[v3].y - sites[v2].y);
  const Eigen::Vector2d e31(sites[v1].x - sites[v3].x, sites[v1].y - sites[v3].y);

  const double f1 = values_[v1];
  const double f2 = values_[v2];
  const double f3 = values_[v3];

  const double df12 = gradients_[v1].dot(e12);
  const double df21 = -gradients_[v2].dot(e12);
  const double df23 = gradients_[v2].dot(e23);
  const double df32 = -gradients_[v3].dot(e23);
  const double df31 = gradients_[v3].dot(e31);
  const double df13 = -gradients_[v1].dot(e31);

  // Bezier ordinates, indexed by the exponents of (b1, b2, b3, b4) where b4
  // weights the split point at the centroid.
  const double c3000 = f1;
  const double c2100 = (df12 + 3.0 * c3000) / 3.0;
  const double c2010 = (df13 + 3.0 * c3000) / 3.0;
  const double c0300 = f2;
  const double c1200 = (df21 + 3.0 * c0300) / 3.0;
  const double c0210 = (df23 + 3.0 * c0300) / 3.0;
  const double c0030 = f3;
  const double c1020 = (df31 + 3.0 * c0030) / 3.0;
  const double c0120 = (df32 + 3.0 * c0030) / 3.0;

  const double c2001 = (c2100 + c2010 + c3000) / 3.0;
  const double c0201 = (c1200 + c0300 + c0210) / 3.0;
  const double c0021 = (c1020 + c0120 + c0030) / 3.0;

  // Cross-boundary derivative directions. Each edge uses the vector between
  // the two adjacent centroids, which both triangles agree on and which is
  // affine invariant.
  std::array<double, 3> g{};
  for (std::size_t k = 0; k < 3; ++k) {
    const int nb = mesh_.neighbors()[static_cast<std::size_t>(t)][k];
    if (nb < 0) {
      g[k] = kHullEdgeDirection;
      continue;
    }
    const auto c = mesh_.barycentric(t, mesh_.centroid(nb));
    double gk = kHullEdgeDirection;
    if (k == 0) {
      gk = (2.0 * c[2] + c[1] - 1.0) / (2.0 - 3.0 * c[2] - 3.0 * c[1]);
    } else if (k == 1) {
      gk = (2.0 * c[0] + c[2] - 1.0) / (2.0 - 3.0 * c[0] - 3.0 * c[2]);
    } else {
      gk = (2.0 * c[1] + c[0] - 1.0) / (2.0 - 3.0 * c[1] - 3.0 * c[0]);
    }
    g[k] = std::isfinite(gk) ? gk : kHullEdgeDirection;
  }

  const double c0111 =
      (g[0] * (-c0300 + 3.0 * c0210 - 3.0 * c0120 + c0030) + (-c0300 + 2.0 * c0210 - c0120 + c0021 + c0201)) / 2.0;
  const double c1011 =
      (g[1] * (-c0030 + 3.0 * c1020 - 3.0 * c2010 + c3000) + (-c0030 + 2.0 * c1020 - c2010 + c2001 + c0021)) / 2.0;
  const double c1101 =
      (g[2] * (-c3000 + 3.0 * c2100 - 3.0 * c1200 + c0300) + (-c3000 + 2.0 * c2100 - c1200 + c2001 + c0201)) / 2.0;

  const double c1002 = (c1101 + c1011 + c2001) / 3.0;
  const double c0102 = (c1101 + c0111 + c0201) / 3.0;
  const double c0012 = (c1011 + c0111 + c0021) / 3.0;
  const double c0003 = (c1002 + c0102 + c0012) / 3.0;

  // Barycentric coordinates inside the sub-triangle holding the point.
  const double minval = std::min({b[0], b[1], b[2]});
  const double b1 = b[0] - minval;
  const double b2 = b[1] - minval;
  const double b3 = b[2] - minval;
  const double b4 = 3.0 * minval;

  return b1 * b1 * b1 * c3000 + 3.0 * b1 * b1 * b2 * c2100 + 3.0 * b1 * b1 * b3 * c2010 +
         3.0 * b1 * b1 * b4 * c2001 + 3.0 * b1 * b2 * b2 * c1200 + 6.0 * b1 * b2 * b4 * c1101 +
         3.0 * b1 * b3 * b3 * c1020 + 6.0 * b1 * b3 * b4 * c1011 + 3.0 * b1 * b4 * b4 * c1002 +
         b2 * b2 * b2 * c0300 + 3.0 * b2 * b2 * b3 * c0210 + 3.0 * b2 * b2 * b4 * c0201 +
         3.0 * b2 * b3 * b3 * c0120 + 6.0 * b2 * b3 * b4 * c0111 + 3.0 * b2 * b4 * b4 * c0102 +
         b3 * b3 * b3 * c0030 + 3.0 * b3 * b3 * b4 * c0021 + 3.0 * b3 * b4 * b4 * c0012 + b4 * b4 * b4 * c0003;
}

Field CloughTocherInterpolator::interpolate(const core::SampleSet& samples, const Grid& grid) const {
  if (grid.status != core::Status::Ok) {
    return Field::undefined(grid, grid.status);
  }
  if (!has_sufficient_samples(samples)) {
    return Field::undefined(grid, core::Status::InsufficientData);
  }

  const auto surface = CloughTocherSurface::fit(samples, options_);
  const FieldDiagnostics diagnostics{
      .site_count = surface.triangulation().site_count(),
      .triangle_count = surface.triangulation().triangle_count(),
      .solver_iterations = surface.gradient_iterations(),
      .solver_converged = surface.gradients_converged(),
  };

  const std::size_t rows = grid.rows();
  const std::size_t cols = grid.cols();
  Eigen::MatrixXd values(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));
  int hint = 0;
  for (std::size_t i = 0; i < rows; ++i) {
    // Serpentine order keeps consecutive nodes adjacent for the walk.
    for (std::size_t jj = 0; jj < cols; ++jj) {
      const std::size_t j = (i % 2 == 0) ? jj : cols - 1 - jj;
      values(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
          surface.evaluate(grid.latitudes[i], grid.longitudes[j], hint);
    }
  }
  return Field(grid, std::move(values), diagnostics);
}

}  // namespace oafield::engine
