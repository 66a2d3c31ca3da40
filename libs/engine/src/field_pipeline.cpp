/**
 * @file field_pipeline.cpp
 * @brief Field pipeline implementation.
 * @author oafield developers
 */

#include "oafield/engine/field_pipeline.hpp"

#include <cmath>

namespace oafield::engine {

core::Status check_request(const FieldRequest& request) {
  if (request.parameter.empty() || request.grid.resolution == 0 || !std::isfinite(request.threshold) ||
      !std::isfinite(request.grid.padding_fraction) || request.grid.padding_fraction < 0.0) {
    return core::Status::InvalidInput;
  }
  return core::Status::Ok;
}

FieldResponse FieldPipeline::evaluate(const table::RawTable& table, const FieldRequest& request) const {
  FieldResponse out{.total_records = table.row_count()};
  out.status = check_request(request);
  if (out.status != core::Status::Ok) {
    return out;
  }

  out.validation = validate_samples(table, request.parameter, request.columns);
  if (out.validation.status != core::Status::Ok) {
    out.status = out.validation.status;
    if (out.status == core::Status::InsufficientData) {
      out.message = kInsufficientDataMessage;
    }
    return out;
  }
  const auto& samples = out.validation.samples;

  out.grid = build_grid(samples, request.grid);
  if (out.grid.status != core::Status::Ok) {
    out.status = out.grid.status;
    return out;
  }
  out.field = interpolator_.interpolate(samples, out.grid);
  if (out.field.status() != core::Status::Ok) {
    out.status = out.field.status();
    return out;
  }

  out.classification = classify_by_threshold(samples, request.threshold);
  if (out.classification.status != core::Status::Ok) {
    out.status = out.classification.status;
    return out;
  }
  out.statistics = summarize(samples, out.classification);
  out.status = out.statistics.status;
  return out;
}

}  // namespace oafield::engine
