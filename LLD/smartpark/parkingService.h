#ifndef SMARTPARK_PARKING_SERVICE_H
#define SMARTPARK_PARKING_SERVICE_H

#include <array>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "smartpark/clock.h"
#include "smartpark/config.h"
#include "smartpark/feeCalculator.h"
#include "smartpark/insights.h"
#include "smartpark/models.h"
#include "smartpark/slotRegistry.h"
#include "smartpark/stateStore.h"
#include "smartpark/visitLedger.h"

namespace smartpark {

// One row of the live board, recomputed on every read.
struct LiveVisit {
  std::string slotId;
  std::string slotNumber;
  Occupant occupant;
  ElapsedTime elapsed;
  Money liveFee = 0;
};

/*
 Allocation service: the single owner of the slot registry and the visit
 ledger for one facility.

   checkIn  - pick a slot, stamp entry, assign
   checkOut - price the visit, append it to the ledger, then free the slot

 Every public call runs under one facility mutex. Queries never mutate, so
 an external timer can poll liveVisits() as often as it likes. Mutations
 bump a change counter; the owner decides when to save.
*/
class ParkingService {
public:
  ParkingService(const FacilityConfig& config, IClock& clock, IStateStore& store);
  ParkingService(const FacilityConfig& config, IClock& clock, IStateStore& store,
                 const ISlotStrategy& strategy);

  // Restores saved state; keeps the provisioned slots when nothing was saved.
  void load();
  void save();
  // saves once saveEvery changes have piled up
  bool saveIfDue();
  // saves when anything changed, used at shutdown
  bool saveIfDirty();
  std::size_t pendingChanges() const;

  Occupant checkIn(const std::string& plateNumber,
                   const std::string& driverName,
                   const std::string& driverPhone,
                   const std::optional<std::string>& requestedSlotId = std::nullopt);
  Transaction checkOut(const std::string& slotId);

  // Admin overrides.
  Occupant forcedRelease(const std::string& slotId);
  Slot addSlot(const std::string& label);
  void setMaintenance(const std::string& slotId, bool on);
  Transaction editTransaction(const std::string& id, const TransactionPatch& patch);
  void deleteTransaction(const std::string& id);
  void factoryReset();

  // Projections.
  Money quote(const std::string& slotId) const;
  std::vector<LiveVisit> liveVisits() const;
  std::vector<LiveVisit> searchActive(const std::string& query) const;
  std::vector<Transaction> searchLedger(const std::string& query) const;
  FacilityStats stats() const;
  std::vector<DailyRevenue> revenueByDay(TimePoint from, TimePoint to) const;
  std::vector<DailyRevenue> revenueLastDays(std::size_t days) const;
  std::array<std::size_t, 24> entriesByHourOfDay() const;
  std::vector<BucketCount> ledgerDurationHistogram() const;
  std::vector<BucketCount> activeDurationHistogram() const;
  InsightSnapshot snapshot() const;

  std::optional<Slot> resolveSlot(const std::string& idOrLabel) const;
  std::vector<Slot> slots() const;
  std::vector<Transaction> transactions() const;
  const FacilityConfig& config() const { return config_; }
  TimePoint now() const { return clock_.now(); }

private:
  Slot pickSlot(const std::optional<std::string>& requestedSlotId) const;
  std::vector<LiveVisit> liveVisitsLocked() const;
  FacilityStats statsLocked() const;
  void saveLocked();

  FacilityConfig config_;
  IClock& clock_;
  IStateStore& store_;
  FirstAvailableStrategy defaultStrategy_;
  const ISlotStrategy& strategy_;

  SlotRegistry registry_;
  VisitLedger ledger_;
  std::size_t dirty_ = 0;
  mutable std::mutex mtx_;
};

} // namespace smartpark

#endif // SMARTPARK_PARKING_SERVICE_H
