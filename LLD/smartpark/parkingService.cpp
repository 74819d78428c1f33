#include "smartpark/parkingService.h"

#include <algorithm>
#include <cctype>
#include <set>

#include <spdlog/spdlog.h>

#include "smartpark/errors.h"
#include "smartpark/ids.h"
#include "smartpark/stateCodec.h"

using namespace std;

namespace smartpark {

namespace {

string trimmed(const string& s) {
  auto first = s.find_first_not_of(" \t\r\n");
  if (first == string::npos) return "";
  auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

string normalizePlate(const string& plate) {
  string out = trimmed(plate);
  transform(out.begin(), out.end(), out.begin(),
            [](unsigned char c) { return static_cast<char>(toupper(c)); });
  return out;
}

void requireText(const char* field, const string& value) {
  if (!isStorableText(value))
    throw ParkingError(ErrorKind::InvalidInput, string(field) + " is not valid UTF-8 text");
}

bool containsNoCase(const string& haystack, const string& needle) {
  auto it = search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                   [](unsigned char a, unsigned char b) { return tolower(a) == tolower(b); });
  return it != haystack.end();
}

} // namespace

ParkingService::ParkingService(const FacilityConfig& config, IClock& clock, IStateStore& store)
  : ParkingService(config, clock, store, defaultStrategy_) {}

ParkingService::ParkingService(const FacilityConfig& config, IClock& clock, IStateStore& store,
                               const ISlotStrategy& strategy)
  : config_(config), clock_(clock), store_(store), strategy_(strategy),
    ledger_(config.tariff.minFee) {
  registry_.replaceAll(SlotRegistry::provision(config_.slotCount, config_.slotPrefix));
}

/*
 Persistence
*/

void ParkingService::load() {
  lock_guard lk(mtx_);
  auto state = store_.load();
  if (!state) {
    spdlog::info("starting {} with {} empty slots", config_.facilityName, registry_.size());
    return;
  }

  // unique slot ids, one occupant per slot, one slot per plate
  set<string> slotIds, occupantIds, plates;
  for (const auto& s : state->slots) {
    if (!slotIds.insert(s.id).second)
      throw ParkingError(ErrorKind::StorageFailure, "saved state repeats slot id " + s.id);
    auto occ = s.occupant();
    if (!occ) continue;
    if (occ->slotId != s.id)
      throw ParkingError(ErrorKind::StorageFailure,
                         occ->plateNumber + " is filed under " + s.id +
                         " but records slot " + occ->slotId);
    if (!occupantIds.insert(occ->id).second || !plates.insert(occ->plateNumber).second)
      throw ParkingError(ErrorKind::StorageFailure,
                         "saved state parks " + occ->plateNumber + " more than once");
  }

  try {
    ledger_.replaceAll(std::move(state->transactions));
  } catch (const ParkingError& e) {
    throw ParkingError(ErrorKind::StorageFailure, string("saved ledger rejected: ") + e.what());
  }
  registry_.replaceAll(std::move(state->slots));
  dirty_ = 0;
  spdlog::info("restored {} slots and {} transactions", registry_.size(), ledger_.countAll());
}

void ParkingService::save() {
  lock_guard lk(mtx_);
  saveLocked();
}

bool ParkingService::saveIfDue() {
  lock_guard lk(mtx_);
  if (dirty_ < config_.saveEvery) return false;
  saveLocked();
  return true;
}

bool ParkingService::saveIfDirty() {
  lock_guard lk(mtx_);
  if (dirty_ == 0) return false;
  saveLocked();
  return true;
}

size_t ParkingService::pendingChanges() const {
  lock_guard lk(mtx_);
  return dirty_;
}

void ParkingService::saveLocked() {
  store_.save(FacilityState{registry_.all(), ledger_.all()});
  dirty_ = 0;
}

/*
 Arrival and departure
*/

Occupant ParkingService::checkIn(const string& plateNumber,
                                 const string& driverName,
                                 const string& driverPhone,
                                 const optional<string>& requestedSlotId) {
  lock_guard lk(mtx_);
  string plate = normalizePlate(plateNumber);
  if (plate.empty())
    throw ParkingError(ErrorKind::InvalidInput, "plate number is required");
  requireText("plate number", plate);
  requireText("driver name", driverName);
  requireText("driver phone", driverPhone);
  if (auto parked = registry_.findByPlate(plate))
    throw ParkingError(ErrorKind::AlreadyParked,
                       plate + " is already parked at " + parked->number);

  Slot target = pickSlot(requestedSlotId);
  Occupant occ{newUUID(), plate, trimmed(driverName), trimmed(driverPhone), clock_.now(), target.id};
  Slot assigned = registry_.assign(target.id, std::move(occ));
  ++dirty_;

  spdlog::info("check-in {} at {}", plate, assigned.number);
  return *assigned.occupant();
}

Slot ParkingService::pickSlot(const optional<string>& requestedSlotId) const {
  if (requestedSlotId) {
    auto requested = registry_.findById(*requestedSlotId);
    if (!requested)
      throw ParkingError(ErrorKind::NotFound, "no slot with id " + *requestedSlotId);
    if (requested->isAvailable()) return *requested;
    spdlog::info("slot {} is {}, using the first available slot",
                 requested->number, toString(requested->status()));
  }
  return registry_.findAvailable(strategy_);
}

Transaction ParkingService::checkOut(const string& slotId) {
  lock_guard lk(mtx_);
  auto slot = registry_.findById(slotId);
  if (!slot) throw ParkingError(ErrorKind::NotFound, "no slot with id " + slotId);
  const Occupant* occ = slot->occupant();
  if (!occ)
    throw ParkingError(ErrorKind::SlotNotOccupied,
                       "slot " + slot->number + " is " + toString(slot->status()));

  TimePoint exitTime = clock_.now();
  Transaction tx;
  tx.id = newUUID();
  tx.plateNumber = occ->plateNumber;
  tx.driverName = occ->driverName;
  tx.entryTime = occ->entryTime;
  tx.exitTime = exitTime;
  tx.durationMinutes = durationMinutes(occ->entryTime, exitTime);
  tx.totalFee = computeFee(occ->entryTime, exitTime, config_.tariff);
  tx.slotNumber = slot->number;

  // ledger first: if the release is lost the visit is still billed
  ledger_.append(tx);
  ++dirty_;
  registry_.release(slotId);

  spdlog::info("check-out {} from {}: {} min, {} RWF",
               tx.plateNumber, tx.slotNumber, tx.durationMinutes, tx.totalFee);
  return tx;
}

/*
 Admin overrides
*/

Occupant ParkingService::forcedRelease(const string& slotId) {
  lock_guard lk(mtx_);
  Occupant dropped = registry_.forcedRelease(slotId);
  ++dirty_;
  return dropped;
}

Slot ParkingService::addSlot(const string& label) {
  lock_guard lk(mtx_);
  string name = trimmed(label);
  if (name.empty())
    throw ParkingError(ErrorKind::InvalidInput, "slot label is required");
  requireText("slot label", name);
  Slot slot = registry_.addSlot(name);
  ++dirty_;
  spdlog::info("added slot {} ({})", slot.number, slot.id);
  return slot;
}

void ParkingService::setMaintenance(const string& slotId, bool on) {
  lock_guard lk(mtx_);
  registry_.setMaintenance(slotId, on);
  ++dirty_;
  spdlog::info("slot {} maintenance {}", slotId, on ? "on" : "off");
}

Transaction ParkingService::editTransaction(const string& id, const TransactionPatch& patch) {
  lock_guard lk(mtx_);
  if (patch.plateNumber) requireText("plate number", *patch.plateNumber);
  if (patch.driverName)  requireText("driver name", *patch.driverName);
  if (patch.slotNumber)  requireText("slot number", *patch.slotNumber);
  Transaction updated = ledger_.edit(id, patch);
  ++dirty_;
  spdlog::warn("transaction {} edited by administrator", id);
  return updated;
}

void ParkingService::deleteTransaction(const string& id) {
  lock_guard lk(mtx_);
  ledger_.remove(id);
  ++dirty_;
  spdlog::warn("transaction {} deleted by administrator", id);
}

void ParkingService::factoryReset() {
  lock_guard lk(mtx_);
  registry_.replaceAll(SlotRegistry::provision(config_.slotCount, config_.slotPrefix));
  ledger_.clear();
  ++dirty_;
  spdlog::warn("factory reset: {} slots reprovisioned, ledger cleared", config_.slotCount);
}

/*
 Projections
*/

Money ParkingService::quote(const string& slotId) const {
  lock_guard lk(mtx_);
  auto slot = registry_.findById(slotId);
  if (!slot) throw ParkingError(ErrorKind::NotFound, "no slot with id " + slotId);
  const Occupant* occ = slot->occupant();
  if (!occ)
    throw ParkingError(ErrorKind::SlotNotOccupied,
                       "slot " + slot->number + " is " + toString(slot->status()));
  return computeFee(occ->entryTime, clock_.now(), config_.tariff);
}

vector<LiveVisit> ParkingService::liveVisitsLocked() const {
  TimePoint now = clock_.now();
  vector<LiveVisit> res;
  for (const auto& s : registry_.occupied()) {
    const Occupant& occ = *s.occupant();
    res.push_back(LiveVisit{s.id, s.number, occ,
                            formatDuration(occ.entryTime, now),
                            computeFee(occ.entryTime, now, config_.tariff)});
  }
  return res;
}

vector<LiveVisit> ParkingService::liveVisits() const {
  lock_guard lk(mtx_);
  return liveVisitsLocked();
}

vector<LiveVisit> ParkingService::searchActive(const string& query) const {
  lock_guard lk(mtx_);
  vector<LiveVisit> res;
  for (auto& v : liveVisitsLocked())
    if (containsNoCase(v.occupant.plateNumber, query) || containsNoCase(v.occupant.driverName, query))
      res.push_back(std::move(v));
  return res;
}

vector<Transaction> ParkingService::searchLedger(const string& query) const {
  lock_guard lk(mtx_);
  return ledger_.search(query);
}

FacilityStats ParkingService::statsLocked() const {
  FacilityStats st;
  st.totalRevenue = ledger_.revenueTotal();
  st.occupiedSlots = registry_.count(SlotStatus::OCCUPIED);
  st.availableSlots = registry_.count(SlotStatus::AVAILABLE);
  st.maintenanceSlots = registry_.count(SlotStatus::MAINTENANCE);
  st.totalEntries = ledger_.countAll() + st.occupiedSlots;
  return st;
}

FacilityStats ParkingService::stats() const {
  lock_guard lk(mtx_);
  return statsLocked();
}

vector<DailyRevenue> ParkingService::revenueByDay(TimePoint from, TimePoint to) const {
  lock_guard lk(mtx_);
  return ledger_.revenueByDay(from, to, config_.utcOffset);
}

vector<DailyRevenue> ParkingService::revenueLastDays(size_t days) const {
  lock_guard lk(mtx_);
  return ledger_.lastDays(days, clock_.now(), config_.utcOffset);
}

array<size_t, 24> ParkingService::entriesByHourOfDay() const {
  lock_guard lk(mtx_);
  return ledger_.entriesByHourOfDay(config_.utcOffset);
}

vector<BucketCount> ParkingService::ledgerDurationHistogram() const {
  lock_guard lk(mtx_);
  return ledger_.durationHistogram();
}

vector<BucketCount> ParkingService::activeDurationHistogram() const {
  lock_guard lk(mtx_);
  TimePoint now = clock_.now();
  vector<chrono::milliseconds> elapsed;
  for (const auto& s : registry_.occupied()) {
    auto d = now - s.occupant()->entryTime;
    if (d < d.zero())
      throw ParkingError(ErrorKind::NegativeDuration,
                         "slot " + s.number + " entered after the current time");
    elapsed.push_back(chrono::floor<chrono::milliseconds>(d));
  }
  return durationHistogram(elapsed, defaultDurationBuckets());
}

InsightSnapshot ParkingService::snapshot() const {
  lock_guard lk(mtx_);
  return InsightSnapshot{config_.facilityName, statsLocked(), ledger_.recent(config_.recentCount)};
}

optional<Slot> ParkingService::resolveSlot(const string& idOrLabel) const {
  lock_guard lk(mtx_);
  return registry_.resolve(idOrLabel);
}

vector<Slot> ParkingService::slots() const {
  lock_guard lk(mtx_);
  return registry_.all();
}

vector<Transaction> ParkingService::transactions() const {
  lock_guard lk(mtx_);
  return ledger_.all();
}

} // namespace smartpark
