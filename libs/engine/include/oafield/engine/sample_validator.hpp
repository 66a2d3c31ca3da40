/**
 * @file sample_validator.hpp
 * @brief Raw table to validated sample set filtering.
 * @author oafield developers
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "oafield/core/types.hpp"
#include "oafield/table/raw_table.hpp"

namespace oafield::engine {

/**
 * @brief Coordinate column names in the source table.
 */
struct ColumnNames {
  std::string latitude{"latitude"};
  std::string longitude{"longitude"};
};

/**
 * @brief Validator output bundle.
 */
struct ValidationResult {
  core::SampleSet samples{};
  std::size_t total_rows{};
  std::size_t rejected_rows{};
  bool columns_present{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Keep rows whose coordinates and `parameter` value are present, finite and in range.
 *
 * Rejected rows are counted, never reported individually. Fewer than
 * `constants::kMinValidSamples` survivors yields `Status::InsufficientData`.
 */
[[nodiscard]] ValidationResult validate_samples(const table::RawTable& table,
                                                std::string_view parameter,
                                                const ColumnNames& columns = {});

/**
 * @brief True when `samples` is large enough for the downstream components.
 */
[[nodiscard]] bool has_sufficient_samples(const core::SampleSet& samples) noexcept;

}  // namespace oafield::engine
