#ifndef SMARTPARK_CONFIG_H
#define SMARTPARK_CONFIG_H

#include <chrono>
#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "smartpark/feeCalculator.h"

namespace smartpark {

struct FacilityConfig {
  std::string facilityName = "SmartPark Rubavu";
  std::size_t slotCount = 24;
  std::string slotPrefix = "A";
  Tariff tariff;
  std::string stateFile = "smartpark_state.json";
  // state is written after this many mutations, and always at shutdown
  std::size_t saveEvery = 5;
  // Rubavu runs on Central Africa Time
  std::chrono::minutes utcOffset{120};
  std::size_t recentCount = 10;
  // empty: no summarizer configured, insights fall back
  std::string insightsCommand;
  std::string logLevel = "info";
};

// Missing keys keep their defaults. Wrong types or out-of-range values
// throw ConfigError.
FacilityConfig configFromJson(const nlohmann::json& j);
FacilityConfig loadConfig(const std::string& path);

} // namespace smartpark

#endif // SMARTPARK_CONFIG_H
