/**
 * @file raw_table.hpp
 * @brief In-memory tabular dataset with optional numeric cells.
 * @author oafield developers
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace oafield::table {

/**
 * @brief Named columns of optional numeric cells.
 *
 * A cell is empty when the source field was blank, non-numeric or `NaN`.
 */
class RawTable {
 public:
  using Row = std::vector<std::optional<double>>;

  RawTable() = default;
  explicit RawTable(std::vector<std::string> columns) : columns_(std::move(columns)) {}

  /**
   * @brief Append a row, padding or truncating it to the column count.
   */
  void add_row(Row row);

  [[nodiscard]] const std::vector<std::string>& columns() const noexcept { return columns_; }
  [[nodiscard]] std::size_t column_count() const noexcept { return columns_.size(); }
  [[nodiscard]] std::size_t row_count() const noexcept { return rows_.size(); }
  [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

  /**
   * @brief Index of a column by exact name.
   */
  [[nodiscard]] std::optional<std::size_t> column_index(std::string_view name) const noexcept;

  [[nodiscard]] std::optional<double> cell(std::size_t row, std::size_t column) const noexcept {
    if (row >= rows_.size() || column >= columns_.size()) {
      return std::nullopt;
    }
    return rows_[row][column];
  }

 private:
  std::vector<std::string> columns_{};
  std::vector<Row> rows_{};
};

}  // namespace oafield::table
