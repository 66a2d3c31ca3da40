/**
 * @file field.cpp
 * @brief Field implementation.
 * @author oafield developers
 */

#include "oafield/engine/field.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "oafield/core/constants.hpp"

namespace oafield::engine {

Field::Field(Grid grid, Eigen::MatrixXd values, FieldDiagnostics diagnostics, core::Status status)
    : grid_(std::move(grid)), values_(std::move(values)), diagnostics_(diagnostics), status_(status) {}

Field Field::undefined(Grid grid, core::Status status) {
  const auto rows = static_cast<Eigen::Index>(grid.rows());
  const auto cols = static_cast<Eigen::Index>(grid.cols());
  Eigen::MatrixXd values = Eigen::MatrixXd::Constant(rows, cols, core::constants::kNoEstimate);
  return Field(std::move(grid), std::move(values), FieldDiagnostics{}, status);
}

bool Field::is_defined(std::size_t i, std::size_t j) const {
  if (i >= rows() || j >= cols()) {
    return false;
  }
  return std::isfinite(values_(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)));
}

std::optional<double> Field::at(std::size_t i, std::size_t j) const {
  if (!is_defined(i, j)) {
    return std::nullopt;
  }
  return values_(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
}

std::size_t Field::defined_count() const {
  return static_cast<std::size_t>(values_.array().isFinite().count());
}

std::optional<ValueRange> Field::value_range() const {
  std::optional<ValueRange> out{};
  for (Eigen::Index j = 0; j < values_.cols(); ++j) {
    for (Eigen::Index i = 0; i < values_.rows(); ++i) {
      const double v = values_(i, j);
      if (!std::isfinite(v)) {
        continue;
      }
      if (!out) {
        out = ValueRange{.min = v, .max = v};
      } else {
        out->min = std::min(out->min, v);
        out->max = std::max(out->max, v);
      }
    }
  }
  return out;
}

std::vector<double> Field::contour_levels(std::size_t count) const {
  const auto range = value_range();
  if (!range || count == 0) {
    return {};
  }
  if (count == 1) {
    return {0.5 * (range->min + range->max)};
  }
  return linspace(range->min, range->max, count);
}

}  // namespace oafield::engine
