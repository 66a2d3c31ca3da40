/**
 * @file test_parameters.cpp
 * @brief Parameter catalog tests.
 * @author oafield developers
 */

#include <spdlog/spdlog.h>

#include "oafield/core/parameters.hpp"

int main() {
  using namespace oafield;

  auto catalog = core::ParameterCatalog::ocean_acidification_defaults();
  if (catalog.size() != 4U || !catalog.contains("pco2") || !catalog.contains("o2conc") || !catalog.contains("temp_ctd") ||
      !catalog.contains("temp_o2")) {
    spdlog::error("default catalog incomplete");
    return 1;
  }
  if (catalog.label_for("pco2") != "pCO₂" || catalog.label_for("temp_ctd") != "Temperature (CTD)" ||
      catalog.label_for("salinity") != "salinity") {
    spdlog::error("label lookup mismatch");
    return 2;
  }
  if (catalog.threshold_for("pco2", 0.0) != 0.0 || catalog.threshold_for("unknown", 7.5) != 7.5) {
    spdlog::error("threshold fallback mismatch");
    return 3;
  }

  catalog.add(core::ParameterInfo{.name = "pco2", .label = "pCO2 (ppm)", .units = "ppm", .default_threshold = 400.0});
  catalog.add(core::ParameterInfo{.name = "salinity", .units = "psu"});
  if (catalog.size() != 5U || catalog.threshold_for("pco2", 0.0) != 400.0 || catalog.label_for("pco2") != "pCO2 (ppm)" ||
      catalog.label_for("salinity") != "salinity") {
    spdlog::error("catalog add/replace mismatch");
    return 4;
  }
  const auto names = catalog.names();
  if (names.size() != 5U || names.front() != "pco2" || names.back() != "salinity") {
    spdlog::error("catalog names mismatch");
    return 5;
  }
  const auto* info = catalog.find("o2conc");
  if (info == nullptr || info->units != "umol/kg" || catalog.find("missing") != nullptr) {
    spdlog::error("catalog find mismatch");
    return 6;
  }
  return 0;
}
