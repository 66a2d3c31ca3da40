/**
 * @file csv_table.hpp
 * @brief CSV loading into a raw table.
 * @author oafield developers
 */
#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "oafield/core/types.hpp"
#include "oafield/table/raw_table.hpp"

namespace oafield::table {

/**
 * @brief Table load output bundle.
 */
struct TableLoad {
  RawTable table{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Split one CSV record, honouring double-quoted fields.
 */
[[nodiscard]] std::vector<std::string> split_csv_record(std::string_view line);

/**
 * @brief Parse a numeric cell; blank, non-numeric and NaN text yield no value.
 */
[[nodiscard]] std::optional<double> parse_numeric_cell(std::string_view text);

/**
 * @brief Parse a header-first CSV stream.
 * @return Table with `status` set; a stream without a header is `DataUnavailable`.
 */
[[nodiscard]] TableLoad parse_csv_table(std::istream& in);

/**
 * @brief Load a header-first CSV file.
 * @return Table with `status` set; an unreadable file is `DataUnavailable`.
 */
[[nodiscard]] TableLoad load_csv_table(const std::filesystem::path& path);

}  // namespace oafield::table
