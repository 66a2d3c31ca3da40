/**
 * @file raw_table.cpp
 * @brief Raw table implementation.
 * @author oafield developers
 */

#include "oafield/table/raw_table.hpp"

#include <utility>

namespace oafield::table {

void RawTable::add_row(Row row) {
  row.resize(columns_.size());
  rows_.push_back(std::move(row));
}

std::optional<std::size_t> RawTable::column_index(std::string_view name) const noexcept {
  for (std::size_t i = 0; i < columns_.size(); ++i) {
    if (columns_[i] == name) {
      return i;
    }
  }
  return std::nullopt;
}

}  // namespace oafield::table
