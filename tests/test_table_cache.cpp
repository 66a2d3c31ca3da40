/**
 * @file test_table_cache.cpp
 * @brief Table cache freshness and invalidation tests.
 * @author oafield developers
 */

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include <spdlog/spdlog.h>

#include "oafield/table/table_cache.hpp"

namespace {

class CountingSource final : public oafield::table::ITableSource {
 public:
  [[nodiscard]] std::string version_key() const override { return key; }

  [[nodiscard]] oafield::table::TableSnapshot fetch() const override {
    ++fetches;
    if (fail) {
      return oafield::table::TableSnapshot{.status = oafield::core::Status::DataUnavailable};
    }
    oafield::table::RawTable t({"latitude", "longitude", "pco2"});
    for (int i = 0; i < rows; ++i) {
      t.add_row({1.0 * i, 2.0 * i, 400.0 + i});
    }
    return oafield::table::TableSnapshot{.table = std::move(t), .version_key = key};
  }

  std::string key{"v1"};
  int rows{4};
  bool fail{false};
  mutable int fetches{0};
};

}  // namespace

int main() {
  using namespace oafield;
  using std::chrono::seconds;

  CountingSource source;
  table::TableCache cache(table::TableCache::Config{.ttl = seconds(300)});
  const auto t0 = table::TableCache::Clock::time_point{} + seconds(1000);

  const auto first = cache.get(source, t0);
  if (first->status != core::Status::Ok || first->table.row_count() != 4U || source.fetches != 1 || cache.misses() != 1U) {
    spdlog::error("initial fetch failed");
    return 1;
  }

  const auto second = cache.get(source, t0 + seconds(299));
  if (second != first || source.fetches != 1 || cache.hits() != 1U) {
    spdlog::error("fresh entry must be served from cache");
    return 2;
  }

  const auto expired = cache.get(source, t0 + seconds(300));
  if (expired == first || source.fetches != 2) {
    spdlog::error("entry older than ttl must be refetched");
    return 3;
  }

  source.key = "v2";
  source.rows = 6;
  const auto changed = cache.get(source, t0 + seconds(301));
  if (changed->table.row_count() != 6U || changed->version_key != "v2" || source.fetches != 3) {
    spdlog::error("version change must be refetched");
    return 4;
  }

  cache.invalidate();
  if (cache.has_entry()) {
    spdlog::error("invalidate must drop the entry");
    return 5;
  }
  static_cast<void>(cache.get(source, t0 + seconds(302)));
  if (source.fetches != 4 || !cache.has_entry()) {
    spdlog::error("fetch after invalidate failed");
    return 6;
  }

  source.key.clear();
  static_cast<void>(cache.get(source, t0 + seconds(303)));
  if (source.fetches != 5) {
    spdlog::error("unknown version must not be served from cache");
    return 7;
  }

  source.key = "v3";
  source.fail = true;
  const auto failed = cache.get(source, t0 + seconds(400));
  if (failed->status != core::Status::DataUnavailable || cache.has_entry()) {
    spdlog::error("failed fetch must not be cached");
    return 8;
  }
  source.fail = false;
  const auto recovered = cache.get(source, t0 + seconds(401));
  if (recovered->status != core::Status::Ok || source.fetches != 7) {
    spdlog::error("recovery fetch failed");
    return 9;
  }

  const auto path = std::filesystem::temp_directory_path() /
                    ("oafield_table_cache_test_" +
                     std::to_string(std::chrono::high_resolution_clock::now().time_since_epoch().count()) + "_" +
                     std::to_string(std::random_device{}()) + ".csv");
  {
    std::ofstream out(path);
    out << "latitude,longitude,o2conc\n1,2,200\n3,4,210\n";
  }
  const table::CsvFileTableSource file_source(table::CsvFileTableSource::Config{.csv_file = path});
  const auto key = file_source.version_key();
  table::TableCache file_cache{};
  const auto a = file_cache.get(file_source, t0);
  const auto b = file_cache.get(file_source, t0 + seconds(1));
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (key.empty() || a->status != core::Status::Ok || a->table.row_count() != 2U || a->version_key != key || a != b) {
    spdlog::error("csv file source caching failed");
    return 10;
  }
  if (!file_source.version_key().empty() || file_source.fetch().status != core::Status::DataUnavailable) {
    spdlog::error("removed csv file must be unavailable");
    return 11;
  }
  return 0;
}
