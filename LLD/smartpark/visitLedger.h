#ifndef SMARTPARK_VISIT_LEDGER_H
#define SMARTPARK_VISIT_LEDGER_H

#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "smartpark/models.h"

namespace smartpark {

// Fields an administrator may overwrite. Fee and duration are not
// recomputed from the times; the caller supplies consistent values.
struct TransactionPatch {
  std::optional<std::string> plateNumber;
  std::optional<std::string> driverName;
  std::optional<TimePoint> entryTime;
  std::optional<TimePoint> exitTime;
  std::optional<long long> durationMinutes;
  std::optional<Money> totalFee;
  std::optional<std::string> slotNumber;
};

// Half-open [lower, upper); no upper bound means open-ended.
struct DurationBucket {
  std::string name;
  std::chrono::minutes lower{0};
  std::optional<std::chrono::minutes> upper;
};

struct BucketCount {
  std::string name;
  std::size_t count = 0;
};

struct DailyRevenue {
  std::string date; // YYYY-MM-DD
  Money amount = 0;
};

// Short (<1h), Mid (1-3h), Long (>3h)
std::vector<DurationBucket> defaultDurationBuckets();

std::vector<BucketCount> durationHistogram(const std::vector<std::chrono::milliseconds>& durations,
                                           const std::vector<DurationBucket>& buckets);

/*
 Visit ledger: every settled visit in insertion order.

 append() is the normal write path and refuses a transaction whose exit is
 not after its entry or whose fee is below the tariff minimum. replaceAll()
 restores saved history, which may predate the current tariff, so it only
 requires causal times and a non-negative fee. edit() holds to causal times
 and applies the current minimum when the fee itself is changed.
*/
class VisitLedger {
public:
  explicit VisitLedger(Money minFee);

  void append(const Transaction& tx);
  void replaceAll(std::vector<Transaction> transactions);
  void clear();

  Transaction edit(const std::string& id, const TransactionPatch& patch);
  void remove(const std::string& id);

  std::optional<Transaction> findById(const std::string& id) const;
  std::vector<Transaction> all() const;
  std::vector<Transaction> recent(std::size_t n) const;
  // plate or driver name, case-insensitive substring
  std::vector<Transaction> search(const std::string& query) const;

  Money revenueTotal() const;
  std::size_t countAll() const;

  // One entry per calendar day of the exit time, from..to inclusive.
  std::vector<DailyRevenue> revenueByDay(TimePoint from, TimePoint to,
                                         std::chrono::minutes utcOffset = std::chrono::minutes(0)) const;
  // The n days ending at now.
  std::vector<DailyRevenue> lastDays(std::size_t n, TimePoint now,
                                     std::chrono::minutes utcOffset = std::chrono::minutes(0)) const;
  std::array<std::size_t, 24> entriesByHourOfDay(std::chrono::minutes utcOffset = std::chrono::minutes(0)) const;
  std::vector<BucketCount> durationHistogram(const std::vector<DurationBucket>& buckets = defaultDurationBuckets()) const;

private:
  void validate(const Transaction& tx, Money floor) const;

  Money minFee_;
  std::vector<Transaction> transactions_;
  mutable std::shared_mutex mtx_;
};

} // namespace smartpark

#endif // SMARTPARK_VISIT_LEDGER_H
