/**
 * @file field_pipeline.hpp
 * @brief Validate, grid, interpolate, classify and summarise one parameter.
 * @author oafield developers
 */
#pragma once

#include <cstddef>
#include <string>

#include "oafield/core/types.hpp"
#include "oafield/engine/field.hpp"
#include "oafield/engine/grid_builder.hpp"
#include "oafield/engine/interpolator.hpp"
#include "oafield/engine/sample_validator.hpp"
#include "oafield/engine/statistics.hpp"
#include "oafield/engine/threshold_classifier.hpp"
#include "oafield/table/raw_table.hpp"

namespace oafield::engine {

inline constexpr const char* kInsufficientDataMessage = "Not enough data points.";

struct FieldRequest {
  std::string parameter{};
  double threshold{};
  GridSpec grid{};
  ColumnNames columns{};
};

struct FieldResponse {
  ValidationResult validation{};
  Grid grid{};
  Field field{};
  ThresholdClassification classification{};
  StatisticsSummary statistics{};
  std::size_t total_records{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Request-scoped orchestration over a caller-supplied table.
 *
 * When validation leaves too few samples the response carries
 * `Status::InsufficientData` and `kInsufficientDataMessage`, and no grid,
 * field, classification or summary is produced.
 */
class FieldPipeline {
 public:
  explicit FieldPipeline(const IScatterInterpolator& interpolator) : interpolator_(interpolator) {}

  [[nodiscard]] FieldResponse evaluate(const table::RawTable& table, const FieldRequest& request) const;

 private:
  const IScatterInterpolator& interpolator_;
};

/**
 * @brief `Status::InvalidInput` for an empty parameter, zero resolution,
 * non-finite threshold or a negative/non-finite padding fraction.
 */
[[nodiscard]] core::Status check_request(const FieldRequest& request);

}  // namespace oafield::engine
