/**
 * @file csv_file_source.cpp
 * @brief CSV file table source implementation.
 * @author oafield developers
 */

#include "oafield/table/table_source.hpp"

#include <system_error>
#include <utility>

#include "oafield/table/csv_table.hpp"

namespace oafield::table {

std::string CsvFileTableSource::version_key() const {
  std::error_code ec;
  const auto size = std::filesystem::file_size(config_.csv_file, ec);
  if (ec) {
    return {};
  }
  const auto mtime = std::filesystem::last_write_time(config_.csv_file, ec);
  if (ec) {
    return {};
  }
  return std::to_string(size) + ":" + std::to_string(mtime.time_since_epoch().count());
}

TableSnapshot CsvFileTableSource::fetch() const {
  // Key first so a concurrent rewrite is caught by the next version check.
  auto key = version_key();
  auto load = load_csv_table(config_.csv_file);
  if (load.status != core::Status::Ok) {
    return TableSnapshot{.status = load.status};
  }
  return TableSnapshot{.table = std::move(load.table), .version_key = std::move(key), .status = core::Status::Ok};
}

}  // namespace oafield::table
