#include "smartpark/stateCodec.h"

#include "smartpark/errors.h"

using namespace std;
using json = nlohmann::json;

namespace smartpark {

namespace {

constexpr int kStateVersion = 1;

TimePoint timeField(const json& j, const char* key) {
  auto text = j.at(key).get<string>();
  auto t = parseIsoTime(text);
  if (!t)
    throw ParkingError(ErrorKind::StorageFailure,
                       string("bad timestamp in '") + key + "': " + text);
  return *t;
}

} // namespace

void to_json(json& j, const Occupant& o) {
  j = json{
    {"id", o.id},
    {"plateNumber", o.plateNumber},
    {"driverName", o.driverName},
    {"driverPhone", o.driverPhone},
    {"entryTime", formatIsoTime(o.entryTime)},
    {"slotId", o.slotId},
  };
}

void from_json(const json& j, Occupant& o) {
  o.id = j.at("id").get<string>();
  o.plateNumber = j.at("plateNumber").get<string>();
  o.driverName = j.at("driverName").get<string>();
  o.driverPhone = j.at("driverPhone").get<string>();
  o.entryTime = timeField(j, "entryTime");
  o.slotId = j.at("slotId").get<string>();
}

void to_json(json& j, const Slot& s) {
  j = json{
    {"id", s.id},
    {"number", s.number},
    {"status", toString(s.status())},
  };
  if (auto occ = s.occupant()) j["currentCar"] = *occ;
}

void from_json(const json& j, Slot& s) {
  s.id = j.at("id").get<string>();
  s.number = j.at("number").get<string>();

  auto statusText = j.at("status").get<string>();
  auto status = slotStatusFromString(statusText);
  if (!status)
    throw ParkingError(ErrorKind::StorageFailure,
                       "slot " + s.id + " has unknown status " + statusText);

  bool hasCar = j.contains("currentCar") && !j.at("currentCar").is_null();
  if (hasCar != (*status == SlotStatus::OCCUPIED))
    throw ParkingError(ErrorKind::StorageFailure,
                       "slot " + s.id + " is " + statusText +
                       (hasCar ? " but carries a vehicle" : " without a vehicle"));

  switch (*status) {
    case SlotStatus::AVAILABLE:   s.state = Available{}; break;
    case SlotStatus::MAINTENANCE: s.state = Maintenance{}; break;
    case SlotStatus::OCCUPIED:
      s.state = Occupied{j.at("currentCar").get<Occupant>()};
      break;
  }
}

void to_json(json& j, const Transaction& t) {
  j = json{
    {"id", t.id},
    {"plateNumber", t.plateNumber},
    {"driverName", t.driverName},
    {"entryTime", formatIsoTime(t.entryTime)},
    {"exitTime", formatIsoTime(t.exitTime)},
    {"durationMinutes", t.durationMinutes},
    {"totalFee", t.totalFee},
    {"slotNumber", t.slotNumber},
  };
}

void from_json(const json& j, Transaction& t) {
  t.id = j.at("id").get<string>();
  t.plateNumber = j.at("plateNumber").get<string>();
  t.driverName = j.at("driverName").get<string>();
  t.entryTime = timeField(j, "entryTime");
  t.exitTime = timeField(j, "exitTime");
  t.durationMinutes = j.at("durationMinutes").get<long long>();
  t.totalFee = j.at("totalFee").get<Money>();
  t.slotNumber = j.at("slotNumber").get<string>();
}

void to_json(json& j, const FacilityStats& s) {
  j = json{
    {"totalRevenue", s.totalRevenue},
    {"totalEntries", s.totalEntries},
    {"availableSlots", s.availableSlots},
    {"occupiedSlots", s.occupiedSlots},
    {"maintenanceSlots", s.maintenanceSlots},
  };
}

void to_json(json& j, const FacilityState& st) {
  j = json{
    {"version", kStateVersion},
    {"slots", st.slots},
    {"transactions", st.transactions},
  };
}

void from_json(const json& j, FacilityState& st) {
  int version = j.value("version", kStateVersion);
  if (version != kStateVersion)
    throw ParkingError(ErrorKind::StorageFailure,
                       "unsupported state version " + to_string(version));
  st.slots = j.at("slots").get<vector<Slot>>();
  st.transactions = j.at("transactions").get<vector<Transaction>>();
}

bool isStorableText(const string& s) {
  try {
    json(s).dump();
    return true;
  } catch (const json::type_error&) {
    return false;
  }
}

} // namespace smartpark
