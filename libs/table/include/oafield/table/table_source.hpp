/**
 * @file table_source.hpp
 * @brief Data source interface and CSV file implementation.
 * @author oafield developers
 */
#pragma once

#include <filesystem>
#include <string>
#include <utility>

#include "oafield/core/types.hpp"
#include "oafield/table/raw_table.hpp"

namespace oafield::table {

/**
 * @brief One fetched copy of a source table.
 */
struct TableSnapshot {
  RawTable table{};
  std::string version_key{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Interface for tabular data sources.
 */
class ITableSource {
 public:
  virtual ~ITableSource() = default;
  /**
   * @brief Cheap identifier that changes whenever the underlying data changes.
   * @return Empty string when the source is currently unavailable.
   */
  [[nodiscard]] virtual std::string version_key() const = 0;
  /**
   * @brief Fetch the full table.
   * @return Snapshot with `status` set.
   */
  [[nodiscard]] virtual TableSnapshot fetch() const = 0;
};

/**
 * @brief Table source backed by a local CSV file.
 */
class CsvFileTableSource final : public ITableSource {
 public:
  /**
   * @brief CSV source configuration.
   */
  struct Config {
    std::filesystem::path csv_file{};
  };

  explicit CsvFileTableSource(Config config) : config_(std::move(config)) {}

  /**
   * @brief Version derived from file size and modification time.
   */
  [[nodiscard]] std::string version_key() const override;
  [[nodiscard]] TableSnapshot fetch() const override;

 private:
  Config config_{};
};

}  // namespace oafield::table
