#include "smartpark/slotRegistry.h"

#include <algorithm>
#include <iomanip>
#include <mutex>
#include <sstream>

#include <spdlog/spdlog.h>

#include "smartpark/errors.h"
#include "smartpark/ids.h"

using namespace std;

namespace smartpark {

optional<size_t> FirstAvailableStrategy::select(const vector<Slot>& slots) const {
  for (size_t i = 0; i < slots.size(); ++i)
    if (slots[i].isAvailable()) return i;
  return nullopt;
}

vector<Slot> SlotRegistry::provision(size_t count, const string& prefix) {
  vector<Slot> res;
  res.reserve(count);
  for (size_t i = 1; i <= count; ++i) {
    ostringstream label;
    label << prefix << setw(2) << setfill('0') << i;
    res.push_back(Slot{"slot-" + to_string(i), label.str(), Available{}});
  }
  return res;
}

void SlotRegistry::replaceAll(vector<Slot> slots) {
  unique_lock lock(mtx_);
  slots_ = std::move(slots);
}

Slot SlotRegistry::addSlot(const string& label) {
  unique_lock lock(mtx_);
  bool duplicate = any_of(slots_.begin(), slots_.end(),
                          [&](const Slot& s) { return s.number == label; });
  if (duplicate)
    spdlog::warn("adding slot with duplicate label {}", label);
  slots_.push_back(Slot{newUUID(), label, Available{}});
  return slots_.back();
}

Slot SlotRegistry::assign(const string& slotId, Occupant occupant) {
  unique_lock lock(mtx_);
  // one occupant, one slot
  for (const auto& s : slots_) {
    auto occ = s.occupant();
    if (occ && occ->id == occupant.id)
      throw ParkingError(ErrorKind::SlotUnavailable,
                         "occupant " + occupant.id + " already holds slot " + s.number);
  }
  auto it = locate(slotId);
  if (!it->isAvailable())
    throw ParkingError(ErrorKind::SlotUnavailable,
                       "slot " + it->number + " is " + toString(it->status()));
  occupant.slotId = it->id;
  it->state = Occupied{std::move(occupant)};
  return *it;
}

Occupant SlotRegistry::release(const string& slotId) {
  unique_lock lock(mtx_);
  return detach(slotId);
}

Occupant SlotRegistry::forcedRelease(const string& slotId) {
  unique_lock lock(mtx_);
  Occupant dropped = detach(slotId);
  spdlog::warn("forced release of slot {}: discarded {} without settlement",
               dropped.slotId, dropped.plateNumber);
  return dropped;
}

void SlotRegistry::setMaintenance(const string& slotId, bool on) {
  unique_lock lock(mtx_);
  auto it = locate(slotId);
  if (on) {
    if (holds_alternative<Occupied>(it->state))
      throw ParkingError(ErrorKind::SlotUnavailable,
                         "slot " + it->number + " is occupied");
    it->state = Maintenance{};
  } else if (holds_alternative<Maintenance>(it->state)) {
    it->state = Available{};
  }
}

Slot SlotRegistry::findFirstAvailable() const {
  return findAvailable(FirstAvailableStrategy{});
}

Slot SlotRegistry::findAvailable(const ISlotStrategy& strategy) const {
  shared_lock lock(mtx_);
  auto idx = strategy.select(slots_);
  if (!idx || *idx >= slots_.size() || !slots_[*idx].isAvailable())
    throw ParkingError(ErrorKind::NoCapacity, "facility at maximum capacity");
  return slots_[*idx];
}

optional<Slot> SlotRegistry::findById(const string& slotId) const {
  shared_lock lock(mtx_);
  for (const auto& s : slots_)
    if (s.id == slotId) return s;
  return nullopt;
}

optional<Slot> SlotRegistry::resolve(const string& idOrLabel) const {
  if (auto byId = findById(idOrLabel)) return byId;
  shared_lock lock(mtx_);
  for (const auto& s : slots_)
    if (s.number == idOrLabel) return s;
  return nullopt;
}

optional<Slot> SlotRegistry::findByPlate(const string& plateNumber) const {
  shared_lock lock(mtx_);
  for (const auto& s : slots_) {
    auto occ = s.occupant();
    if (occ && occ->plateNumber == plateNumber) return s;
  }
  return nullopt;
}

vector<Slot> SlotRegistry::all() const {
  shared_lock lock(mtx_);
  return slots_;
}

vector<Slot> SlotRegistry::occupied() const {
  shared_lock lock(mtx_);
  vector<Slot> res;
  for (const auto& s : slots_)
    if (s.occupant()) res.push_back(s);
  return res;
}

size_t SlotRegistry::count(SlotStatus status) const {
  shared_lock lock(mtx_);
  return count_if(slots_.begin(), slots_.end(),
                  [&](const Slot& s) { return s.status() == status; });
}

size_t SlotRegistry::size() const {
  shared_lock lock(mtx_);
  return slots_.size();
}

// caller holds the unique lock
vector<Slot>::iterator SlotRegistry::locate(const string& slotId) {
  auto it = find_if(slots_.begin(), slots_.end(),
                    [&](const Slot& s) { return s.id == slotId; });
  if (it == slots_.end())
    throw ParkingError(ErrorKind::NotFound, "no slot with id " + slotId);
  return it;
}

// caller holds the unique lock
Occupant SlotRegistry::detach(const string& slotId) {
  auto it = locate(slotId);
  auto occ = get_if<Occupied>(&it->state);
  if (!occ)
    throw ParkingError(ErrorKind::SlotNotOccupied,
                       "slot " + it->number + " is " + toString(it->status()));
  Occupant out = std::move(occ->occupant);
  it->state = Available{};
  return out;
}

} // namespace smartpark
