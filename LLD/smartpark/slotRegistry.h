#ifndef SMARTPARK_SLOT_REGISTRY_H
#define SMARTPARK_SLOT_REGISTRY_H

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "smartpark/models.h"

namespace smartpark {

// Slot selection strategy. Allocation order is pluggable, first-fit by default.
class ISlotStrategy {
public:
  virtual ~ISlotStrategy() = default;
  // index into slots of the chosen slot, or nullopt when none qualifies
  virtual std::optional<std::size_t> select(const std::vector<Slot>& slots) const = 0;
};

// First AVAILABLE slot in insertion order.
class FirstAvailableStrategy : public ISlotStrategy {
public:
  std::optional<std::size_t> select(const std::vector<Slot>& slots) const override;
};

/*
 Slot registry: owns every slot and its occupancy state.

   AVAILABLE --assign--> OCCUPIED --release/forcedRelease--> AVAILABLE
   AVAILABLE <--setMaintenance--> MAINTENANCE

 Reads return copies so callers never hold references into the registry.
 Unknown ids throw NotFound.
*/
class SlotRegistry {
public:
  // slot-1..slot-N labelled <prefix>01..<prefix>N
  static std::vector<Slot> provision(std::size_t count, const std::string& prefix);

  void replaceAll(std::vector<Slot> slots);

  // Appends an AVAILABLE slot with a fresh id. Duplicate labels are allowed.
  Slot addSlot(const std::string& label);

  Slot assign(const std::string& slotId, Occupant occupant);
  Occupant release(const std::string& slotId);
  // Admin override: drops the occupant without settlement.
  Occupant forcedRelease(const std::string& slotId);
  void setMaintenance(const std::string& slotId, bool on);

  Slot findFirstAvailable() const;
  Slot findAvailable(const ISlotStrategy& strategy) const;

  std::optional<Slot> findById(const std::string& slotId) const;
  // id first, then the first slot carrying that label
  std::optional<Slot> resolve(const std::string& idOrLabel) const;
  std::optional<Slot> findByPlate(const std::string& plateNumber) const;

  std::vector<Slot> all() const;
  std::vector<Slot> occupied() const;
  std::size_t count(SlotStatus status) const;
  std::size_t size() const;

private:
  std::vector<Slot>::iterator locate(const std::string& slotId);
  Occupant detach(const std::string& slotId);

  std::vector<Slot> slots_;
  mutable std::shared_mutex mtx_;
};

} // namespace smartpark

#endif // SMARTPARK_SLOT_REGISTRY_H
