#ifndef SMARTPARK_STATE_CODEC_H
#define SMARTPARK_STATE_CODEC_H

#include <string>

#include <nlohmann/json.hpp>

#include "smartpark/models.h"

namespace smartpark {

/*
 JSON mapping of the data model. Field names follow the facility's
 existing records (plateNumber, entryTime, currentCar, ...); timestamps are
 ISO-8601 UTC with milliseconds and statuses are their enum names.
 Decoding failures throw ParkingError(StorageFailure).
*/
void to_json(nlohmann::json& j, const Occupant& o);
void from_json(const nlohmann::json& j, Occupant& o);

void to_json(nlohmann::json& j, const Slot& s);
void from_json(const nlohmann::json& j, Slot& s);

void to_json(nlohmann::json& j, const Transaction& t);
void from_json(const nlohmann::json& j, Transaction& t);

void to_json(nlohmann::json& j, const FacilityStats& s);

void to_json(nlohmann::json& j, const FacilityState& st);
void from_json(const nlohmann::json& j, FacilityState& st);

// True when s can be written into a state document (valid UTF-8).
bool isStorableText(const std::string& s);

} // namespace smartpark

#endif // SMARTPARK_STATE_CODEC_H
