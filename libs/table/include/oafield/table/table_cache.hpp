/**
 * @file table_cache.hpp
 * @brief Caller-owned cache of fetched source tables.
 * @author oafield developers
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>

#include "oafield/table/table_source.hpp"

namespace oafield::table {

/**
 * @brief Single-entry table cache keyed on the source version and a TTL.
 *
 * A cached snapshot is reused while the source reports the same version key
 * and the entry is younger than the TTL. Failed fetches are never cached.
 */
class TableCache {
 public:
  using Clock = std::chrono::steady_clock;

  /**
   * @brief Cache configuration.
   */
  struct Config {
    std::chrono::seconds ttl{300};
  };

  TableCache() = default;
  explicit TableCache(Config config) : config_(config) {}

  /**
   * @brief Return the cached snapshot or fetch a fresh one.
   * @param source Data source to query.
   * @param now Current time; injectable for deterministic expiry.
   */
  [[nodiscard]] std::shared_ptr<const TableSnapshot> get(const ITableSource& source, Clock::time_point now);
  [[nodiscard]] std::shared_ptr<const TableSnapshot> get(const ITableSource& source) { return get(source, Clock::now()); }

  /**
   * @brief Drop the cached snapshot.
   */
  void invalidate() noexcept;

  [[nodiscard]] bool has_entry() const noexcept { return entry_ != nullptr; }
  [[nodiscard]] std::size_t hits() const noexcept { return hits_; }
  [[nodiscard]] std::size_t misses() const noexcept { return misses_; }

 private:
  Config config_{};
  std::shared_ptr<const TableSnapshot> entry_{};
  Clock::time_point fetched_at_{};
  std::size_t hits_{};
  std::size_t misses_{};
};

}  // namespace oafield::table
