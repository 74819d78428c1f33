#include "smartpark/models.h"

using namespace std;

namespace smartpark {

const char* toString(SlotStatus status) {
  switch (status) {
    case SlotStatus::AVAILABLE:   return "AVAILABLE";
    case SlotStatus::OCCUPIED:    return "OCCUPIED";
    case SlotStatus::MAINTENANCE: return "MAINTENANCE";
  }
  return "AVAILABLE";
}

optional<SlotStatus> slotStatusFromString(const string& text) {
  if (text == "AVAILABLE")   return SlotStatus::AVAILABLE;
  if (text == "OCCUPIED")    return SlotStatus::OCCUPIED;
  if (text == "MAINTENANCE") return SlotStatus::MAINTENANCE;
  return nullopt;
}

SlotStatus Slot::status() const {
  if (holds_alternative<Occupied>(state)) return SlotStatus::OCCUPIED;
  if (holds_alternative<Maintenance>(state)) return SlotStatus::MAINTENANCE;
  return SlotStatus::AVAILABLE;
}

const Occupant* Slot::occupant() const {
  auto occ = get_if<Occupied>(&state);
  return occ ? &occ->occupant : nullptr;
}

} // namespace smartpark
