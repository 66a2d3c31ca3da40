/**
 * @file parameters.cpp
 * @brief Parameter catalog implementation.
 * @author oafield developers
 */

#include "oafield/core/parameters.hpp"

#include <algorithm>
#include <utility>

namespace oafield::core {

ParameterCatalog ParameterCatalog::ocean_acidification_defaults() {
  ParameterCatalog catalog;
  catalog.add(ParameterInfo{.name = "pco2", .label = "pCO₂", .units = "ppm"});
  catalog.add(ParameterInfo{.name = "o2conc", .label = "O₂ Concentration", .units = "umol/kg"});
  catalog.add(ParameterInfo{.name = "temp_ctd", .label = "Temperature (CTD)", .units = "degC"});
  catalog.add(ParameterInfo{.name = "temp_o2", .label = "Temperature (O₂)", .units = "degC"});
  return catalog;
}

void ParameterCatalog::add(ParameterInfo info) {
  const auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const ParameterInfo& e) { return e.name == info.name; });
  if (it != entries_.end()) {
    *it = std::move(info);
    return;
  }
  entries_.push_back(std::move(info));
}

const ParameterInfo* ParameterCatalog::find(std::string_view name) const noexcept {
  for (const auto& e : entries_) {
    if (e.name == name) {
      return &e;
    }
  }
  return nullptr;
}

std::vector<std::string> ParameterCatalog::names() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) {
    out.push_back(e.name);
  }
  return out;
}

std::string ParameterCatalog::label_for(std::string_view name) const {
  const auto* info = find(name);
  if (info == nullptr || info->label.empty()) {
    return std::string(name);
  }
  return info->label;
}

double ParameterCatalog::threshold_for(std::string_view name, double fallback) const noexcept {
  const auto* info = find(name);
  if (info == nullptr || !info->default_threshold.has_value()) {
    return fallback;
  }
  return *info->default_threshold;
}

}  // namespace oafield::core
