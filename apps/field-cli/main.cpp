/**
 * @file main.cpp
 * @brief oafield interpolated-field command-line entrypoint.
 * @author oafield developers
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "oafield/core/constants.hpp"
#include "oafield/core/parameters.hpp"
#include "oafield/engine/clough_tocher.hpp"
#include "oafield/engine/field_pipeline.hpp"
#include "oafield/table/table_cache.hpp"

namespace {

constexpr std::size_t kFilledContourLevels = 15;
constexpr std::size_t kLineContourLevels = 10;

bool write_grid_csv(const std::filesystem::path& path, const oafield::engine::Field& field) {
  std::ofstream out(path);
  if (!out) {
    return false;
  }
  out << "latitude,longitude,value\n";
  const auto& grid = field.grid();
  for (std::size_t i = 0; i < field.rows(); ++i) {
    for (std::size_t j = 0; j < field.cols(); ++j) {
      const auto v = field.at(i, j);
      if (v) {
        out << fmt::format("{:.8f},{:.8f},{:.12e}\n", grid.latitudes[i], grid.longitudes[j], *v);
      } else {
        out << fmt::format("{:.8f},{:.8f},nan\n", grid.latitudes[i], grid.longitudes[j]);
      }
    }
  }
  return static_cast<bool>(out);
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3 || argc > 7) {
    spdlog::error("usage: field_cli <table_csv> <parameter> [threshold] [resolution] [padding_fraction] [grid_csv]");
    spdlog::error("parameters: pco2 | o2conc | temp_ctd | temp_o2 | any numeric column");
    return 1;
  }

  const auto catalog = oafield::core::ParameterCatalog::ocean_acidification_defaults();
  const std::filesystem::path table_csv = argv[1];
  const std::string parameter = argv[2];
  const double threshold = (argc >= 4) ? std::atof(argv[3]) : catalog.threshold_for(parameter, 0.0);
  const int resolution = (argc >= 5) ? std::atoi(argv[4])
                                     : static_cast<int>(oafield::core::constants::kDefaultGridResolution);
  const double padding = (argc >= 6) ? std::atof(argv[5]) : oafield::core::constants::kDefaultPaddingFraction;
  const std::string grid_csv = (argc >= 7) ? argv[6] : "";
  if (resolution <= 0) {
    spdlog::error("resolution must be a positive integer");
    return 1;
  }

  const oafield::table::CsvFileTableSource source(oafield::table::CsvFileTableSource::Config{.csv_file = table_csv});
  oafield::table::TableCache cache{};
  const auto snapshot = cache.get(source);
  if (snapshot->status != oafield::core::Status::Ok) {
    spdlog::error("failed to load table {}: {}", table_csv.string(), oafield::core::to_string(snapshot->status));
    return 2;
  }

  const oafield::engine::CloughTocherInterpolator interpolator{};
  const oafield::engine::FieldPipeline pipeline(interpolator);
  const auto r = pipeline.evaluate(
      snapshot->table,
      oafield::engine::FieldRequest{
          .parameter = parameter,
          .threshold = threshold,
          .grid = oafield::engine::GridSpec{.resolution = static_cast<std::size_t>(resolution), .padding_fraction = padding},
      });

  if (r.status == oafield::core::Status::InsufficientData) {
    spdlog::error("{}", r.message);
    return 3;
  }
  if (r.status != oafield::core::Status::Ok) {
    spdlog::error("field evaluation failed: {}", oafield::core::to_string(r.status));
    return 3;
  }
  if (r.validation.rejected_rows > 0) {
    spdlog::warn("{} of {} rows rejected for {}", r.validation.rejected_rows, r.validation.total_rows, parameter);
  }
  const auto& diag = r.field.diagnostics();
  if (!diag.solver_converged) {
    spdlog::warn("gradient estimation did not converge after {} iterations", diag.solver_iterations);
  }

  const auto& s = r.statistics;
  const auto center = oafield::engine::padded_bounds(r.validation.samples, 0.0).center();
  fmt::print("parameter={} label=\"{}\" threshold={}\n", parameter, catalog.label_for(parameter), threshold);
  fmt::print("total_records={} valid_samples={}\n", r.total_records, s.count);
  fmt::print("mean={} median={} std_dev={} min={} max={}\n", s.mean, s.median, s.std_dev, s.min, s.max);
  fmt::print("above={} ({:.1f}%) below={} ({:.1f}%)\n", s.above_count, 100.0 * s.above_fraction, s.below_count,
             100.0 * s.below_fraction);
  fmt::print("bounds lat=[{}, {}] lon=[{}, {}] center=({}, {})\n", r.grid.bounds.lat_min, r.grid.bounds.lat_max,
             r.grid.bounds.lon_min, r.grid.bounds.lon_max, center.lat_deg, center.lon_deg);
  fmt::print("grid={}x{} defined_nodes={} sites={} triangles={} gradient_iterations={}\n", r.field.rows(),
             r.field.cols(), r.field.defined_count(), diag.site_count, diag.triangle_count, diag.solver_iterations);
  if (const auto range = r.field.value_range()) {
    fmt::print("field_min={} field_max={}\n", range->min, range->max);
    fmt::print("filled_levels={}\n", fmt::join(r.field.contour_levels(kFilledContourLevels), ","));
    fmt::print("line_levels={}\n", fmt::join(r.field.contour_levels(kLineContourLevels), ","));
  } else {
    spdlog::warn("no grid node lies inside the sample hull");
  }

  if (!grid_csv.empty()) {
    if (!write_grid_csv(grid_csv, r.field)) {
      spdlog::error("failed to write grid csv: {}", grid_csv);
      return 4;
    }
    spdlog::info("wrote {} grid nodes to {}", r.grid.node_count(), grid_csv);
  }
  return 0;
}
