/**
 * @file table_cache.cpp
 * @brief Table cache implementation.
 * @author oafield developers
 */

#include "oafield/table/table_cache.hpp"

namespace oafield::table {

std::shared_ptr<const TableSnapshot> TableCache::get(const ITableSource& source, Clock::time_point now) {
  if (entry_) {
    const bool fresh = (now - fetched_at_) < config_.ttl;
    const auto key = source.version_key();
    if (fresh && !key.empty() && key == entry_->version_key) {
      ++hits_;
      return entry_;
    }
  }

  ++misses_;
  auto snapshot = std::make_shared<const TableSnapshot>(source.fetch());
  if (snapshot->status != core::Status::Ok) {
    entry_.reset();
    return snapshot;
  }
  entry_ = snapshot;
  fetched_at_ = now;
  return entry_;
}

void TableCache::invalidate() noexcept {
  entry_.reset();
  fetched_at_ = Clock::time_point{};
}

}  // namespace oafield::table
