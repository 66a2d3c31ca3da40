/**
 * @file test_triangulation.cpp
 * @brief Delaunay triangulation and point location tests.
 * @author oafield developers
 */

#include <cmath>
#include <random>
#include <vector>

#include <spdlog/spdlog.h>

#include "oafield/engine/triangulation.hpp"

namespace {

using oafield::engine::PlanarPoint;
using oafield::engine::Triangulation;

double cross(const PlanarPoint& o, const PlanarPoint& a, const PlanarPoint& b) {
  return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
}

double triangle_area(const Triangulation& tri, std::size_t t) {
  const auto& v = tri.triangles()[t];
  const auto& s = tri.sites();
  return 0.5 * cross(s[static_cast<std::size_t>(v[0])], s[static_cast<std::size_t>(v[1])], s[static_cast<std::size_t>(v[2])]);
}

bool all_ccw(const Triangulation& tri) {
  for (std::size_t t = 0; t < tri.triangle_count(); ++t) {
    if (triangle_area(tri, t) <= 0.0) {
      return false;
    }
  }
  return true;
}

double total_area(const Triangulation& tri) {
  double a = 0.0;
  for (std::size_t t = 0; t < tri.triangle_count(); ++t) {
    a += triangle_area(tri, t);
  }
  return a;
}

// Neighbour links must be symmetric and share the opposite edge.
bool neighbors_consistent(const Triangulation& tri) {
  for (std::size_t t = 0; t < tri.triangle_count(); ++t) {
    for (std::size_t k = 0; k < 3; ++k) {
      const int nb = tri.neighbors()[t][k];
      if (nb < 0) {
        continue;
      }
      const auto& back = tri.neighbors()[static_cast<std::size_t>(nb)];
      if (back[0] != static_cast<int>(t) && back[1] != static_cast<int>(t) && back[2] != static_cast<int>(t)) {
        return false;
      }
      const auto& me = tri.triangles()[t];
      const auto& other = tri.triangles()[static_cast<std::size_t>(nb)];
      int shared = 0;
      for (const int v : me) {
        if (v != me[k] && (v == other[0] || v == other[1] || v == other[2])) {
          ++shared;
        }
      }
      if (shared != 2) {
        return false;
      }
    }
  }
  return true;
}

bool empty_circumcircles(const Triangulation& tri) {
  const auto& s = tri.sites();
  for (const auto& v : tri.triangles()) {
    const auto& a = s[static_cast<std::size_t>(v[0])];
    const auto& b = s[static_cast<std::size_t>(v[1])];
    const auto& c = s[static_cast<std::size_t>(v[2])];
    for (const auto& p : s) {
      const double ax = a.x - p.x;
      const double ay = a.y - p.y;
      const double bx = b.x - p.x;
      const double by = b.y - p.y;
      const double cx = c.x - p.x;
      const double cy = c.y - p.y;
      const double a2 = ax * ax + ay * ay;
      const double b2 = bx * bx + by * by;
      const double c2 = cx * cx + cy * cy;
      const double det = a2 * (bx * cy - by * cx) + b2 * (cx * ay - cy * ax) + c2 * (ax * by - ay * bx);
      const double bound = a2 * (std::abs(bx * cy) + std::abs(by * cx)) + b2 * (std::abs(cx * ay) + std::abs(cy * ax)) +
                           c2 * (std::abs(ax * by) + std::abs(ay * bx));
      if (det > 1e-9 * bound) {
        return false;
      }
    }
  }
  return true;
}

}  // namespace

int main() {
  const auto square = Triangulation::build({{0.0, 0.0}, {1.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}});
  if (square.triangle_count() != 2U || !all_ccw(square) || std::abs(total_area(square) - 1.0) > 1e-12 ||
      !neighbors_consistent(square)) {
    spdlog::error("square triangulation mismatch");
    return 1;
  }
  if (square.locate({0.25, 0.5}) < 0 || square.locate({0.75, 0.5}, 1) < 0 || square.locate({1.5, 0.5}) != -1 ||
      square.locate({-0.1, -0.1}, 1) != -1) {
    spdlog::error("square point location mismatch");
    return 2;
  }

  const auto centred = Triangulation::build({{0.0, 0.0}, {1.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}, {0.5, 0.5}});
  if (centred.triangle_count() != 4U || !all_ccw(centred) || !neighbors_consistent(centred)) {
    spdlog::error("centred square triangulation mismatch");
    return 3;
  }
  const auto vn = centred.vertex_neighbors();
  if (vn[4].size() != 4U || vn[0].size() != 3U) {
    spdlog::error("vertex neighbour mismatch");
    return 4;
  }
  const int t = centred.locate({0.5, 0.2});
  const auto b = centred.barycentric(t, {0.5, 0.2});
  if (t < 0 || std::abs(b[0] + b[1] + b[2] - 1.0) > 1e-12 || b[0] < -1e-12 || b[1] < -1e-12 || b[2] < -1e-12) {
    spdlog::error("barycentric mismatch");
    return 5;
  }
  const auto c = centred.centroid(t);
  const auto bc = centred.barycentric(t, c);
  if (std::abs(bc[0] - 1.0 / 3.0) > 1e-12 || std::abs(bc[1] - 1.0 / 3.0) > 1e-12) {
    spdlog::error("centroid mismatch");
    return 6;
  }

  const auto dup = Triangulation::build({{0.0, 0.0}, {1.0, 0.0}, {0.0, 1.0}, {1.0, 0.0}, {1.0, 1.0}});
  if (dup.site_count() != 5U || dup.triangle_count() != 2U || !all_ccw(dup)) {
    spdlog::error("duplicate site handling mismatch");
    return 7;
  }

  const auto collinear = Triangulation::build({{0.0, 0.0}, {1.0, 1.0}, {2.0, 2.0}, {3.0, 3.0}});
  const auto coincident = Triangulation::build({{2.0, 2.0}, {2.0, 2.0}, {2.0, 2.0}, {2.0, 2.0}});
  if (!collinear.empty() || !coincident.empty() || collinear.locate({1.0, 1.0}) != -1 ||
      !Triangulation::build({{0.0, 0.0}, {1.0, 0.0}}).empty()) {
    spdlog::error("degenerate input must give an empty triangulation");
    return 8;
  }

  // Collinear run along the left hull edge.
  const auto fan = Triangulation::build({{0.0, 0.0}, {0.0, 1.0}, {0.0, 2.0}, {0.0, 3.0}, {2.0, 1.5}, {3.0, 0.0}});
  if (fan.empty() || !all_ccw(fan) || !neighbors_consistent(fan) || !empty_circumcircles(fan)) {
    spdlog::error("collinear seed triangulation mismatch");
    return 9;
  }

  std::mt19937 rng(20240611U);
  std::uniform_real_distribution<double> lat(35.0, 38.0);
  std::uniform_real_distribution<double> lon(-124.0, -121.0);
  std::vector<PlanarPoint> pts;
  for (int i = 0; i < 200; ++i) {
    pts.push_back(PlanarPoint{.x = lon(rng), .y = lat(rng)});
  }
  const auto cloud = Triangulation::build(pts);
  if (cloud.empty() || !all_ccw(cloud) || !neighbors_consistent(cloud) || !empty_circumcircles(cloud)) {
    spdlog::error("random cloud is not a valid Delaunay triangulation");
    return 10;
  }
  int hint = 0;
  for (const auto& p : pts) {
    const int found = cloud.locate(p, hint);
    if (found < 0) {
      spdlog::error("sample site not located");
      return 11;
    }
    hint = found;
  }
  if (cloud.locate({-120.0, 36.0}, hint) != -1 || cloud.locate({-122.5, 39.0}) != -1) {
    spdlog::error("outside point located");
    return 12;
  }
  return 0;
}
