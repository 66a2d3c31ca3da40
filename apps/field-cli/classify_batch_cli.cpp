/**
 * @file classify_batch_cli.cpp
 * @brief Batch threshold classification of survey samples to CSV.
 * @author oafield developers
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "oafield/engine/field_pipeline.hpp"
#include "oafield/engine/sample_validator.hpp"
#include "oafield/engine/statistics.hpp"
#include "oafield/engine/threshold_classifier.hpp"
#include "oafield/table/csv_table.hpp"

namespace {

void write_class_rows(std::ofstream& out, const oafield::core::SampleSet& samples, const char* label) {
  for (const auto& s : samples) {
    out << fmt::format("{:.8f},{:.8f},{:.12e},{}\n", s.lat_deg, s.lon_deg, s.value, label);
  }
}

}  // namespace

int main(int argc, char** argv) {
  if (argc != 5) {
    spdlog::error("usage: classify_batch_cli <table_csv> <parameter> <threshold> <output_csv>");
    spdlog::error("output row: latitude,longitude,value,class");
    return 1;
  }

  const std::filesystem::path input_path = argv[1];
  const std::string parameter = argv[2];
  const double threshold = std::atof(argv[3]);
  const std::filesystem::path output_path = argv[4];

  const auto load = oafield::table::load_csv_table(input_path);
  if (load.status != oafield::core::Status::Ok) {
    spdlog::error("failed to open input csv: {}", input_path.string());
    return 2;
  }

  const auto validation = oafield::engine::validate_samples(load.table, parameter);
  if (validation.status != oafield::core::Status::Ok) {
    spdlog::error("{} ({} valid of {} rows)", oafield::engine::kInsufficientDataMessage, validation.samples.size(),
                  validation.total_rows);
    return 3;
  }
  if (validation.rejected_rows > 0) {
    spdlog::warn("skipping {} rows without valid {}", validation.rejected_rows, parameter);
  }

  const auto classification = oafield::engine::classify_by_threshold(validation.samples, threshold);
  if (classification.status != oafield::core::Status::Ok) {
    spdlog::error("classification failed: {}", oafield::core::to_string(classification.status));
    return 3;
  }

  std::ofstream out(output_path);
  if (!out) {
    spdlog::error("failed to open output file: {}", output_path.string());
    return 4;
  }
  out << fmt::format("#record_type=metadata,schema=classify_batch_v1,project=oafield,parameter={},threshold={}\n",
                     parameter, threshold);
  out << "latitude,longitude,value,class\n";
  write_class_rows(out, classification.above, "above");
  write_class_rows(out, classification.below, "below");

  const auto s = oafield::engine::summarize(validation.samples, classification);
  spdlog::info("classified {} samples: above={} ({:.1f}%) below={} ({:.1f}%)", s.count, s.above_count,
               100.0 * s.above_fraction, s.below_count, 100.0 * s.below_fraction);
  return 0;
}
