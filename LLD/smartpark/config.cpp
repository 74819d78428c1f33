#include "smartpark/config.h"

#include <fstream>

#include <spdlog/spdlog.h>

#include "smartpark/errors.h"

using namespace std;
using json = nlohmann::json;

namespace smartpark {

namespace {

template <typename T>
void readKey(const json& j, const char* key, T& out) {
  if (!j.contains(key)) return;
  try {
    out = j.at(key).get<T>();
  } catch (const json::exception& e) {
    throw ParkingError(ErrorKind::ConfigError,
                       string("config key '") + key + "': " + e.what());
  }
}

} // namespace

FacilityConfig configFromJson(const json& j) {
  if (!j.is_object())
    throw ParkingError(ErrorKind::ConfigError, "config root must be an object");

  FacilityConfig cfg;
  long long slotCount = static_cast<long long>(cfg.slotCount);
  long long saveEvery = static_cast<long long>(cfg.saveEvery);
  long long recentCount = static_cast<long long>(cfg.recentCount);
  long long utcOffset = cfg.utcOffset.count();

  readKey(j, "facility_name", cfg.facilityName);
  readKey(j, "slot_count", slotCount);
  readKey(j, "slot_prefix", cfg.slotPrefix);
  readKey(j, "hourly_rate", cfg.tariff.hourlyRate);
  readKey(j, "min_fee", cfg.tariff.minFee);
  readKey(j, "state_file", cfg.stateFile);
  readKey(j, "save_every", saveEvery);
  readKey(j, "utc_offset_minutes", utcOffset);
  readKey(j, "recent_count", recentCount);
  readKey(j, "insights_command", cfg.insightsCommand);
  readKey(j, "log_level", cfg.logLevel);

  if (slotCount <= 0)
    throw ParkingError(ErrorKind::ConfigError, "slot_count must be positive");
  if (saveEvery <= 0)
    throw ParkingError(ErrorKind::ConfigError, "save_every must be positive");
  if (recentCount <= 0)
    throw ParkingError(ErrorKind::ConfigError, "recent_count must be positive");
  if (cfg.tariff.hourlyRate <= 0)
    throw ParkingError(ErrorKind::ConfigError, "hourly_rate must be positive");
  if (cfg.tariff.minFee < 0)
    throw ParkingError(ErrorKind::ConfigError, "min_fee must not be negative");
  if (utcOffset < -14 * 60 || utcOffset > 14 * 60)
    throw ParkingError(ErrorKind::ConfigError, "utc_offset_minutes out of range");
  if (cfg.stateFile.empty())
    throw ParkingError(ErrorKind::ConfigError, "state_file must not be empty");

  cfg.slotCount = static_cast<size_t>(slotCount);
  cfg.saveEvery = static_cast<size_t>(saveEvery);
  cfg.recentCount = static_cast<size_t>(recentCount);
  cfg.utcOffset = chrono::minutes(utcOffset);
  return cfg;
}

FacilityConfig loadConfig(const string& path) {
  ifstream f(path);
  if (!f) throw ParkingError(ErrorKind::ConfigError, "could not open config file: " + path);

  json j;
  try {
    f >> j;
  } catch (const json::parse_error& e) {
    throw ParkingError(ErrorKind::ConfigError, "config file " + path + ": " + e.what());
  }
  FacilityConfig cfg = configFromJson(j);
  spdlog::debug("loaded config {} ({} slots, {} RWF/h, min {} RWF)",
                path, cfg.slotCount, cfg.tariff.hourlyRate, cfg.tariff.minFee);
  return cfg;
}

} // namespace smartpark
