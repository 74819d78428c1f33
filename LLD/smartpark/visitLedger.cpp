#include "smartpark/visitLedger.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>
#include <numeric>

#include "smartpark/errors.h"

using namespace std;

namespace smartpark {

namespace {

string lowered(string s) {
  transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return static_cast<char>(tolower(c)); });
  return s;
}

bool contains(const string& haystack, const string& needle) {
  return lowered(haystack).find(lowered(needle)) != string::npos;
}

} // namespace

vector<DurationBucket> defaultDurationBuckets() {
  using chrono::hours;
  return {
    {"Short (<1h)", hours(0), chrono::minutes(hours(1))},
    {"Mid (1-3h)",  hours(1), chrono::minutes(hours(3))},
    {"Long (>3h)",  hours(3), nullopt},
  };
}

vector<BucketCount> durationHistogram(const vector<chrono::milliseconds>& durations,
                                      const vector<DurationBucket>& buckets) {
  vector<BucketCount> res;
  for (const auto& b : buckets) res.push_back(BucketCount{b.name, 0});

  for (auto d : durations) {
    for (size_t i = 0; i < buckets.size(); ++i) {
      const auto& b = buckets[i];
      bool last = (i + 1 == buckets.size());
      if (d < b.lower) continue;
      if (last || !b.upper || d < *b.upper) {
        ++res[i].count;
        break;
      }
    }
  }
  return res;
}

VisitLedger::VisitLedger(Money minFee) : minFee_(minFee) {}

void VisitLedger::validate(const Transaction& tx, Money floor) const {
  if (tx.exitTime <= tx.entryTime)
    throw ParkingError(ErrorKind::InvalidTransaction,
                       "exit time " + formatIsoTime(tx.exitTime) +
                       " is not after entry time " + formatIsoTime(tx.entryTime));
  if (tx.totalFee < floor)
    throw ParkingError(ErrorKind::InvalidTransaction,
                       "fee " + to_string(tx.totalFee) + " is below the minimum of " +
                       to_string(floor));
}

void VisitLedger::append(const Transaction& tx) {
  validate(tx, minFee_);
  unique_lock lock(mtx_);
  transactions_.push_back(tx);
}

void VisitLedger::replaceAll(vector<Transaction> transactions) {
  // billed under whatever tariff was in force then
  for (const auto& tx : transactions) validate(tx, 0);
  unique_lock lock(mtx_);
  transactions_ = std::move(transactions);
}

void VisitLedger::clear() {
  unique_lock lock(mtx_);
  transactions_.clear();
}

Transaction VisitLedger::edit(const string& id, const TransactionPatch& patch) {
  unique_lock lock(mtx_);
  auto it = find_if(transactions_.begin(), transactions_.end(),
                    [&](const Transaction& t) { return t.id == id; });
  if (it == transactions_.end())
    throw ParkingError(ErrorKind::NotFound, "no transaction with id " + id);

  Transaction updated = *it;
  if (patch.plateNumber)     updated.plateNumber = *patch.plateNumber;
  if (patch.driverName)      updated.driverName = *patch.driverName;
  if (patch.entryTime)       updated.entryTime = *patch.entryTime;
  if (patch.exitTime)        updated.exitTime = *patch.exitTime;
  if (patch.durationMinutes) updated.durationMinutes = *patch.durationMinutes;
  if (patch.totalFee)        updated.totalFee = *patch.totalFee;
  if (patch.slotNumber)      updated.slotNumber = *patch.slotNumber;
  validate(updated, patch.totalFee ? minFee_ : 0);

  *it = updated;
  return updated;
}

void VisitLedger::remove(const string& id) {
  unique_lock lock(mtx_);
  auto it = find_if(transactions_.begin(), transactions_.end(),
                    [&](const Transaction& t) { return t.id == id; });
  if (it == transactions_.end())
    throw ParkingError(ErrorKind::NotFound, "no transaction with id " + id);
  transactions_.erase(it);
}

optional<Transaction> VisitLedger::findById(const string& id) const {
  shared_lock lock(mtx_);
  for (const auto& t : transactions_)
    if (t.id == id) return t;
  return nullopt;
}

vector<Transaction> VisitLedger::all() const {
  shared_lock lock(mtx_);
  return transactions_;
}

vector<Transaction> VisitLedger::recent(size_t n) const {
  shared_lock lock(mtx_);
  size_t start = transactions_.size() > n ? transactions_.size() - n : 0;
  return vector<Transaction>(transactions_.begin() + start, transactions_.end());
}

vector<Transaction> VisitLedger::search(const string& query) const {
  shared_lock lock(mtx_);
  vector<Transaction> res;
  for (const auto& t : transactions_)
    if (contains(t.plateNumber, query) || contains(t.driverName, query))
      res.push_back(t);
  return res;
}

Money VisitLedger::revenueTotal() const {
  shared_lock lock(mtx_);
  return accumulate(transactions_.begin(), transactions_.end(), Money{0},
                    [](Money sum, const Transaction& t) { return sum + t.totalFee; });
}

size_t VisitLedger::countAll() const {
  shared_lock lock(mtx_);
  return transactions_.size();
}

vector<DailyRevenue> VisitLedger::revenueByDay(TimePoint from, TimePoint to,
                                               chrono::minutes utcOffset) const {
  long long first = dayNumber(from, utcOffset);
  long long last = dayNumber(to, utcOffset);
  if (last < first)
    throw ParkingError(ErrorKind::InvalidInput, "revenue range ends before it starts");

  // every day in range is present, empty days stay at zero
  map<long long, Money> totals;
  for (long long d = first; d <= last; ++d) totals[d] = 0;

  {
    shared_lock lock(mtx_);
    for (const auto& t : transactions_) {
      auto it = totals.find(dayNumber(t.exitTime, utcOffset));
      if (it != totals.end()) it->second += t.totalFee;
    }
  }

  vector<DailyRevenue> res;
  for (auto& [day, amount] : totals)
    res.push_back(DailyRevenue{formatDay(day), amount});
  return res;
}

vector<DailyRevenue> VisitLedger::lastDays(size_t n, TimePoint now,
                                           chrono::minutes utcOffset) const {
  if (n == 0) return {};
  auto from = now - chrono::hours(24) * static_cast<long long>(n - 1);
  return revenueByDay(from, now, utcOffset);
}

array<size_t, 24> VisitLedger::entriesByHourOfDay(chrono::minutes utcOffset) const {
  array<size_t, 24> counts{};
  shared_lock lock(mtx_);
  for (const auto& t : transactions_)
    ++counts[hourOfDay(t.entryTime, utcOffset)];
  return counts;
}

vector<BucketCount> VisitLedger::durationHistogram(const vector<DurationBucket>& buckets) const {
  vector<chrono::milliseconds> durations;
  {
    shared_lock lock(mtx_);
    for (const auto& t : transactions_)
      durations.push_back(chrono::minutes(t.durationMinutes));
  }
  return smartpark::durationHistogram(durations, buckets);
}

} // namespace smartpark
