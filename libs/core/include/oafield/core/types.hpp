/**
 * @file types.hpp
 * @brief Core domain types for oafield.
 * @author oafield developers
 */
#pragma once

#include <cstdint>
#include <vector>

namespace oafield::core {

/**
 * @brief Standard status code carried by every engine output.
 */
enum class Status : std::uint8_t { Ok, InvalidInput, InsufficientData, DataUnavailable };

/**
 * @brief Stable lowercase name of a status code for logs and exports.
 */
[[nodiscard]] constexpr const char* to_string(Status status) noexcept {
  switch (status) {
    case Status::Ok:
      return "ok";
    case Status::InvalidInput:
      return "invalid_input";
    case Status::InsufficientData:
      return "insufficient_data";
    case Status::DataUnavailable:
      return "data_unavailable";
  }
  return "unknown";
}

/**
 * @brief Latitude/longitude pair in degrees.
 */
struct GeoPoint {
  double lat_deg{};
  double lon_deg{};
};

/**
 * @brief One validated measurement.
 *
 * Latitude is in [-90, 90], longitude in [-180, 180] and `value` is finite.
 */
struct Sample {
  double lat_deg{};
  double lon_deg{};
  double value{};
};

/**
 * @brief Validated measurements for one parameter of one data snapshot.
 */
using SampleSet = std::vector<Sample>;

/**
 * @brief Axis-aligned latitude/longitude box.
 */
struct BoundingBox {
  double lat_min{};
  double lat_max{};
  double lon_min{};
  double lon_max{};

  [[nodiscard]] double lat_span() const noexcept { return lat_max - lat_min; }
  [[nodiscard]] double lon_span() const noexcept { return lon_max - lon_min; }
  [[nodiscard]] GeoPoint center() const noexcept {
    return GeoPoint{.lat_deg = 0.5 * (lat_min + lat_max), .lon_deg = 0.5 * (lon_min + lon_max)};
  }
  [[nodiscard]] bool contains(const GeoPoint& p) const noexcept {
    return p.lat_deg >= lat_min && p.lat_deg <= lat_max && p.lon_deg >= lon_min && p.lon_deg <= lon_max;
  }
};

}  // namespace oafield::core
