/**
 * @file sample_validator.cpp
 * @brief Sample validator implementation.
 * @author oafield developers
 */

#include "oafield/engine/sample_validator.hpp"

#include <cmath>
#include <optional>

#include "oafield/core/constants.hpp"

namespace oafield::engine {
namespace {

bool valid_latitude(double lat) {
  return std::isfinite(lat) && lat >= core::constants::kLatMinDeg && lat <= core::constants::kLatMaxDeg;
}

bool valid_longitude(double lon) {
  return std::isfinite(lon) && lon >= core::constants::kLonMinDeg && lon <= core::constants::kLonMaxDeg;
}

}  // namespace

bool has_sufficient_samples(const core::SampleSet& samples) noexcept {
  return samples.size() >= core::constants::kMinValidSamples;
}

ValidationResult validate_samples(const table::RawTable& table, std::string_view parameter, const ColumnNames& columns) {
  ValidationResult out{};
  out.total_rows = table.row_count();

  const auto lat_col = table.column_index(columns.latitude);
  const auto lon_col = table.column_index(columns.longitude);
  std::optional<std::size_t> value_col{};
  if (!parameter.empty()) {
    value_col = table.column_index(parameter);
  }
  out.columns_present = lat_col.has_value() && lon_col.has_value() && value_col.has_value();
  if (!out.columns_present) {
    out.rejected_rows = out.total_rows;
    out.status = core::Status::InsufficientData;
    return out;
  }

  out.samples.reserve(table.row_count());
  for (std::size_t r = 0; r < table.row_count(); ++r) {
    const auto lat = table.cell(r, *lat_col);
    const auto lon = table.cell(r, *lon_col);
    const auto value = table.cell(r, *value_col);
    if (!lat || !lon || !value || !valid_latitude(*lat) || !valid_longitude(*lon) || !std::isfinite(*value)) {
      ++out.rejected_rows;
      continue;
    }
    out.samples.push_back(core::Sample{.lat_deg = *lat, .lon_deg = *lon, .value = *value});
  }

  if (!has_sufficient_samples(out.samples)) {
    out.status = core::Status::InsufficientData;
  }
  return out;
}

}  // namespace oafield::engine
