/**
 * @file field.hpp
 * @brief Interpolated scalar field over a regular grid.
 * @author oafield developers
 */
#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <Eigen/Dense>

#include "oafield/core/types.hpp"
#include "oafield/engine/grid_builder.hpp"

namespace oafield::engine {

/**
 * @brief Solver and mesh facts recorded while producing a field.
 */
struct FieldDiagnostics {
  std::size_t site_count{};
  std::size_t triangle_count{};
  int solver_iterations{};
  bool solver_converged{true};
};

/**
 * @brief Closed range of defined field values.
 */
struct ValueRange {
  double min{};
  double max{};
};

/**
 * @brief Scalar estimate per grid node, or "no estimate".
 *
 * `values()(i, j)` belongs to `grid().node(i, j)`. Nodes without an estimate
 * hold `constants::kNoEstimate` (NaN) and must be queried through
 * `is_defined` / `at`; they are never zero.
 */
class Field {
 public:
  Field() = default;
  Field(Grid grid, Eigen::MatrixXd values, FieldDiagnostics diagnostics = {},
        core::Status status = core::Status::Ok);

  /**
   * @brief Field of the grid's shape with no estimate anywhere.
   */
  static Field undefined(Grid grid, core::Status status = core::Status::Ok);

  [[nodiscard]] const Grid& grid() const noexcept { return grid_; }
  [[nodiscard]] const Eigen::MatrixXd& values() const noexcept { return values_; }
  [[nodiscard]] const FieldDiagnostics& diagnostics() const noexcept { return diagnostics_; }
  [[nodiscard]] core::Status status() const noexcept { return status_; }
  [[nodiscard]] std::size_t rows() const noexcept { return static_cast<std::size_t>(values_.rows()); }
  [[nodiscard]] std::size_t cols() const noexcept { return static_cast<std::size_t>(values_.cols()); }

  [[nodiscard]] bool is_defined(std::size_t i, std::size_t j) const;
  [[nodiscard]] std::optional<double> at(std::size_t i, std::size_t j) const;
  [[nodiscard]] std::size_t defined_count() const;

  /**
   * @brief Min/max over defined nodes; empty when no node is defined.
   */
  [[nodiscard]] std::optional<ValueRange> value_range() const;

  /**
   * @brief `count` evenly spaced levels spanning the defined range.
   * @return Empty when nothing is defined or `count` is zero.
   */
  [[nodiscard]] std::vector<double> contour_levels(std::size_t count) const;

 private:
  Grid grid_{};
  Eigen::MatrixXd values_{};
  FieldDiagnostics diagnostics_{};
  core::Status status_{core::Status::Ok};
};

}  // namespace oafield::engine
