#ifndef SMARTPARK_MODELS_H
#define SMARTPARK_MODELS_H

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "smartpark/clock.h"

namespace smartpark {

// Whole Rwandan francs.
using Money = long long;

enum class SlotStatus { AVAILABLE, OCCUPIED, MAINTENANCE };

const char* toString(SlotStatus status);
std::optional<SlotStatus> slotStatusFromString(const std::string& text);

/*
 Data models:

   Occupant    - an open visit, owned by exactly one slot
   Slot        - a parking space; its state variant carries the occupant,
                 so "occupied" and "has an occupant" cannot disagree
   Transaction - a settled visit, appended to the ledger
*/

struct Occupant {
  std::string id;
  std::string plateNumber;
  std::string driverName;
  std::string driverPhone;
  TimePoint entryTime;
  std::string slotId;
};

struct Available {};
struct Occupied { Occupant occupant; };
struct Maintenance {};

using SlotState = std::variant<Available, Occupied, Maintenance>;

struct Slot {
  std::string id;
  std::string number;
  SlotState state = Available{};

  SlotStatus status() const;
  bool isAvailable() const { return std::holds_alternative<Available>(state); }
  // nullptr unless the slot is occupied
  const Occupant* occupant() const;
};

struct Transaction {
  std::string id;
  std::string plateNumber;
  std::string driverName;
  TimePoint entryTime;
  TimePoint exitTime;
  long long durationMinutes = 0;
  Money totalFee = 0;
  std::string slotNumber;
};

// Derived on demand from the registry and the ledger, never stored.
struct FacilityStats {
  Money totalRevenue = 0;
  std::size_t totalEntries = 0;
  std::size_t availableSlots = 0;
  std::size_t occupiedSlots = 0;
  std::size_t maintenanceSlots = 0;
};

// Everything the persistence boundary loads and saves.
struct FacilityState {
  std::vector<Slot> slots;
  std::vector<Transaction> transactions;
};

} // namespace smartpark

#endif // SMARTPARK_MODELS_H
