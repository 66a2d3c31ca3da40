/**
 * @file triangulation.cpp
 * @brief Qhull-backed Delaunay triangulation and point location.
 * @author oafield developers
 */

#include "oafield/engine/triangulation.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <unordered_map>
#include <utility>

#include <libqhullcpp/Qhull.h>
#include <libqhullcpp/QhullError.h>
#include <libqhullcpp/QhullFacet.h>
#include <libqhullcpp/QhullFacetList.h>
#include <libqhullcpp/QhullFacetSet.h>
#include <libqhullcpp/QhullPoint.h>
#include <libqhullcpp/QhullVertex.h>
#include <libqhullcpp/QhullVertexSet.h>

namespace oafield::engine {
namespace {

constexpr double kBarycentricEps = 100.0 * std::numeric_limits<double>::epsilon();

// Delaunay via the lifted convex hull; options match scipy.spatial.Delaunay in 2-D.
constexpr const char* kQhullDelaunayOptions = "d Qbb Qc Qz Q12 Qt";

}  // namespace

Triangulation Triangulation::build(std::vector<PlanarPoint> sites) {
  Triangulation out;
  out.sites_ = std::move(sites);
  const auto& raw = out.sites_;
  const std::size_t n = raw.size();
  if (n < 3) {
    return out;
  }

  double min_x = raw.front().x;
  double max_x = raw.front().x;
  double min_y = raw.front().y;
  double max_y = raw.front().y;
  for (const auto& s : raw) {
    min_x = std::min(min_x, s.x);
    max_x = std::max(max_x, s.x);
    min_y = std::min(min_y, s.y);
    max_y = std::max(max_y, s.y);
  }
  // Uniform scale keeps the Delaunay property of the raw coordinates.
  const double scale = std::max(max_x - min_x, max_y - min_y);
  if (!std::isfinite(scale) || scale <= 0.0) {
    return out;
  }
  std::vector<double> coords;
  coords.reserve(2 * n);
  for (const auto& s : raw) {
    coords.push_back((s.x - min_x) / scale);
    coords.push_back((s.y - min_y) / scale);
  }

  orgQhull::Qhull qhull;
  try {
    qhull.runQhull("", 2, static_cast<int>(n), coords.data(), kQhullDelaunayOptions);
  } catch (const orgQhull::QhullError&) {
    // Collinear or coincident sites have no 2-D hull.
    return out;
  }

  std::unordered_map<countT, int> index_of;
  std::vector<orgQhull::QhullFacet> facets;
  for (const auto& facet : qhull.facetList()) {
    if (facet.isUpperDelaunay() || !facet.isSimplicial()) {
      continue;
    }
    Triangle tri{};
    std::size_t k = 0;
    for (const auto& vertex : facet.vertices()) {
      if (k < 3) {
        tri[k] = static_cast<int>(vertex.point().id());
      }
      ++k;
    }
    if (k != 3 || tri[0] < 0 || tri[1] < 0 || tri[2] < 0 || tri[0] >= static_cast<int>(n) ||
        tri[1] >= static_cast<int>(n) || tri[2] >= static_cast<int>(n)) {
      continue;
    }
    const auto& a = raw[static_cast<std::size_t>(tri[0])];
    const auto& b = raw[static_cast<std::size_t>(tri[1])];
    const auto& c = raw[static_cast<std::size_t>(tri[2])];
    if ((b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x) < 0.0) {
      std::swap(tri[1], tri[2]);
    }
    index_of.emplace(facet.id(), static_cast<int>(out.triangles_.size()));
    out.triangles_.push_back(tri);
    facets.push_back(facet);
  }

  out.neighbors_.assign(out.triangles_.size(), Triangle{-1, -1, -1});
  out.transforms_.resize(out.triangles_.size());
  for (std::size_t t = 0; t < out.triangles_.size(); ++t) {
    const auto& tri = out.triangles_[t];
    for (const auto& other : facets[t].neighborFacets()) {
      const auto it = index_of.find(other.id());
      if (it == index_of.end()) {
        continue;
      }
      // The neighbour sits across the edge opposite the vertex it lacks.
      const auto& shared = out.triangles_[static_cast<std::size_t>(it->second)];
      for (std::size_t v = 0; v < 3; ++v) {
        if (std::find(shared.begin(), shared.end(), tri[v]) == shared.end()) {
          out.neighbors_[t][v] = it->second;
          break;
        }
      }
    }

    const auto& a = raw[static_cast<std::size_t>(tri[0])];
    const auto& b = raw[static_cast<std::size_t>(tri[1])];
    const auto& c = raw[static_cast<std::size_t>(tri[2])];
    Eigen::Matrix2d m;
    m << a.x - c.x, b.x - c.x, a.y - c.y, b.y - c.y;
    const double det = m.determinant();
    auto& xf = out.transforms_[t];
    xf.origin = c;
    xf.valid = std::isfinite(det) && det != 0.0;
    if (xf.valid) {
      xf.inverse = m.inverse();
    }
  }
  return out;
}

std::array<double, 3> Triangulation::barycentric(int t, const PlanarPoint& p) const {
  const auto& xf = transforms_[static_cast<std::size_t>(t)];
  if (!xf.valid) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    return {nan, nan, nan};
  }
  const Eigen::Vector2d r = xf.inverse * Eigen::Vector2d(p.x - xf.origin.x, p.y - xf.origin.y);
  return {r(0), r(1), 1.0 - r(0) - r(1)};
}

PlanarPoint Triangulation::centroid(int t) const {
  const auto& tri = triangles_[static_cast<std::size_t>(t)];
  PlanarPoint c{};
  for (const int v : tri) {
    c.x += sites_[static_cast<std::size_t>(v)].x;
    c.y += sites_[static_cast<std::size_t>(v)].y;
  }
  c.x /= 3.0;
  c.y /= 3.0;
  return c;
}

bool Triangulation::contains(int t, const PlanarPoint& p) const {
  const auto b = barycentric(t, p);
  return b[0] >= -kBarycentricEps && b[1] >= -kBarycentricEps && b[2] >= -kBarycentricEps;
}

int Triangulation::locate(const PlanarPoint& p, int hint) const {
  const int count = static_cast<int>(triangles_.size());
  if (count == 0) {
    return -1;
  }
  int t = (hint >= 0 && hint < count) ? hint : 0;

  // Directed walk toward the most violated edge.
  for (int step = 0; step <= count; ++step) {
    const auto b = barycentric(t, p);
    if (!std::isfinite(b[0]) || !std::isfinite(b[1]) || !std::isfinite(b[2])) {
      break;
    }
    std::size_t k = 0;
    if (b[1] < b[k]) {
      k = 1;
    }
    if (b[2] < b[k]) {
      k = 2;
    }
    if (b[k] >= -kBarycentricEps) {
      return t;
    }
    const int next = neighbors_[static_cast<std::size_t>(t)][k];
    if (next < 0) {
      return -1;
    }
    t = next;
  }

  for (int i = 0; i < count; ++i) {
    if (contains(i, p)) {
      return i;
    }
  }
  return -1;
}

std::vector<std::vector<int>> Triangulation::vertex_neighbors() const {
  std::vector<std::vector<int>> out(sites_.size());
  for (const auto& tri : triangles_) {
    for (std::size_t e = 0; e < 3; ++e) {
      const int a = tri[e];
      const int b = tri[(e + 1) % 3];
      out[static_cast<std::size_t>(a)].push_back(b);
      out[static_cast<std::size_t>(b)].push_back(a);
    }
  }
  for (auto& list : out) {
    std::sort(list.begin(), list.end());
    list.erase(std::unique(list.begin(), list.end()), list.end());
  }
  return out;
}

}  // namespace oafield::engine
