/**
 * @file parameters.hpp
 * @brief Display metadata for measured parameters.
 * @author oafield developers
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace oafield::core {

/**
 * @brief Display metadata for one parameter column.
 */
struct ParameterInfo {
  std::string name{};
  std::string label{};
  std::string units{};
  std::optional<double> default_threshold{};
};

/**
 * @brief Explicit mapping from parameter column name to display metadata.
 *
 * The engine never consults the catalog; callers use it to label output and
 * to pick a threshold when the user supplies none.
 */
class ParameterCatalog {
 public:
  /**
   * @brief Catalog covering the ocean-acidification survey columns.
   */
  static ParameterCatalog ocean_acidification_defaults();

  /**
   * @brief Add or replace the entry for `info.name`.
   */
  void add(ParameterInfo info);

  [[nodiscard]] const ParameterInfo* find(std::string_view name) const noexcept;
  [[nodiscard]] bool contains(std::string_view name) const noexcept { return find(name) != nullptr; }
  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] std::vector<std::string> names() const;

  /**
   * @brief Label for a parameter, falling back to the column name itself.
   */
  [[nodiscard]] std::string label_for(std::string_view name) const;

  /**
   * @brief Configured threshold for a parameter, or `fallback` when unset.
   */
  [[nodiscard]] double threshold_for(std::string_view name, double fallback) const noexcept;

 private:
  std::vector<ParameterInfo> entries_{};
};

}  // namespace oafield::core
