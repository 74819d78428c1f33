#include <gtest/gtest.h>

#include "smartpark/visitLedger.h"
#include "testSupport.h"

using namespace std;
using namespace smartpark;
using chrono::minutes;

namespace {

Transaction visit(const string& id, const string& entry, const string& exit, Money fee,
                  long long mins = 60) {
  Transaction t;
  t.id = id;
  t.plateNumber = "RAB" + id;
  t.driverName = "Driver " + id;
  t.entryTime = at(entry);
  t.exitTime = at(exit);
  t.durationMinutes = mins;
  t.totalFee = fee;
  t.slotNumber = "A01";
  return t;
}

size_t countOf(const vector<BucketCount>& buckets, const string& name) {
  for (const auto& b : buckets)
    if (b.name == name) return b.count;
  ADD_FAILURE() << "no bucket " << name;
  return 0;
}

} // namespace

TEST(VisitLedger, AppendKeepsInsertionOrderAndTotals) {
  VisitLedger ledger(300);
  ledger.append(visit("1", "2026-10-17T08:00:00Z", "2026-10-17T09:00:00Z", 500));
  ledger.append(visit("2", "2026-10-17T08:30:00Z", "2026-10-17T10:00:00Z", 1000));

  EXPECT_EQ(ledger.countAll(), 2u);
  EXPECT_EQ(ledger.revenueTotal(), 1500);
  auto all = ledger.all();
  EXPECT_EQ(all[0].id, "1");
  EXPECT_EQ(all[1].id, "2");
}

TEST(VisitLedger, AppendRejectsNonCausalTimes) {
  VisitLedger ledger(300);
  EXPECT_PARKING_ERROR(ledger.append(visit("1", "2026-10-17T08:00:00Z", "2026-10-17T08:00:00Z", 500)),
                       ErrorKind::InvalidTransaction);
  EXPECT_PARKING_ERROR(ledger.append(visit("2", "2026-10-17T08:00:00Z", "2026-10-17T07:59:59Z", 500)),
                       ErrorKind::InvalidTransaction);
  EXPECT_EQ(ledger.countAll(), 0u);
}

TEST(VisitLedger, AppendRejectsFeesBelowTheMinimum) {
  VisitLedger ledger(300);
  EXPECT_PARKING_ERROR(ledger.append(visit("1", "2026-10-17T08:00:00Z", "2026-10-17T09:00:00Z", 299)),
                       ErrorKind::InvalidTransaction);
  ledger.append(visit("2", "2026-10-17T08:00:00Z", "2026-10-17T09:00:00Z", 300));
  EXPECT_EQ(ledger.countAll(), 1u);
}

TEST(VisitLedger, RevenueByDayReportsEmptyDaysAsZero) {
  VisitLedger ledger(300);
  auto days = ledger.revenueByDay(at("2026-10-15T12:00:00Z"), at("2026-10-17T12:00:00Z"));
  ASSERT_EQ(days.size(), 3u);
  EXPECT_EQ(days[0].date, "2026-10-15");
  EXPECT_EQ(days[1].date, "2026-10-16");
  EXPECT_EQ(days[2].date, "2026-10-17");
  for (const auto& d : days) EXPECT_EQ(d.amount, 0);
}

TEST(VisitLedger, RevenueByDayBucketsByExitDate) {
  VisitLedger ledger(300);
  ledger.append(visit("1", "2026-10-15T08:00:00Z", "2026-10-15T10:00:00Z", 500));
  ledger.append(visit("2", "2026-10-15T20:00:00Z", "2026-10-15T22:00:00Z", 1000));
  ledger.append(visit("3", "2026-10-14T23:00:00Z", "2026-10-16T01:00:00Z", 13000));
  ledger.append(visit("4", "2026-10-01T08:00:00Z", "2026-10-01T09:00:00Z", 700));

  auto utc = ledger.revenueByDay(at("2026-10-15T00:00:00Z"), at("2026-10-16T00:00:00Z"));
  ASSERT_EQ(utc.size(), 2u);
  EXPECT_EQ(utc[0].amount, 1500);
  EXPECT_EQ(utc[1].amount, 13000);

  // at UTC+2 the 22:00Z exit falls on the next day
  auto cat = ledger.revenueByDay(at("2026-10-15T00:00:00Z"), at("2026-10-16T00:00:00Z"), minutes(120));
  ASSERT_EQ(cat.size(), 2u);
  EXPECT_EQ(cat[0].date, "2026-10-15");
  EXPECT_EQ(cat[0].amount, 500);
  EXPECT_EQ(cat[1].amount, 14000);
}

TEST(VisitLedger, RevenueRangeMustNotBeReversed) {
  VisitLedger ledger(300);
  EXPECT_PARKING_ERROR(ledger.revenueByDay(at("2026-10-17T00:00:00Z"), at("2026-10-15T00:00:00Z")),
                       ErrorKind::InvalidInput);
}

TEST(VisitLedger, LastDaysEndsToday) {
  VisitLedger ledger(300);
  ledger.append(visit("1", "2026-10-17T08:00:00Z", "2026-10-17T09:00:00Z", 500));
  auto week = ledger.lastDays(7, at("2026-10-17T18:00:00Z"));
  ASSERT_EQ(week.size(), 7u);
  EXPECT_EQ(week.front().date, "2026-10-11");
  EXPECT_EQ(week.back().date, "2026-10-17");
  EXPECT_EQ(week.back().amount, 500);
  EXPECT_TRUE(ledger.lastDays(0, at("2026-10-17T18:00:00Z")).empty());
}

TEST(VisitLedger, EntriesByHourOfDayUsesEntryTime) {
  VisitLedger ledger(300);
  ledger.append(visit("1", "2026-10-17T08:15:00Z", "2026-10-17T11:00:00Z", 1500));
  ledger.append(visit("2", "2026-10-16T08:59:59Z", "2026-10-16T09:30:00Z", 500));
  ledger.append(visit("3", "2026-10-17T17:00:00Z", "2026-10-17T18:00:00Z", 500));

  auto utc = ledger.entriesByHourOfDay();
  EXPECT_EQ(utc[8], 2u);
  EXPECT_EQ(utc[17], 1u);
  EXPECT_EQ(utc[9], 0u);

  auto local = ledger.entriesByHourOfDay(minutes(120));
  EXPECT_EQ(local[10], 2u);
  EXPECT_EQ(local[19], 1u);
  EXPECT_EQ(local[8], 0u);
}

TEST(VisitLedger, DurationHistogramBoundariesGoUp) {
  VisitLedger ledger(300);
  ledger.append(visit("1", "2026-10-17T08:00:00Z", "2026-10-17T08:59:00Z", 500, 59));
  ledger.append(visit("2", "2026-10-17T08:00:00Z", "2026-10-17T09:00:00Z", 500, 60));
  ledger.append(visit("3", "2026-10-17T08:00:00Z", "2026-10-17T10:59:00Z", 1500, 179));
  ledger.append(visit("4", "2026-10-17T08:00:00Z", "2026-10-17T11:00:00Z", 1500, 180));
  ledger.append(visit("5", "2026-10-17T08:00:00Z", "2026-10-17T18:00:00Z", 5000, 600));

  auto buckets = ledger.durationHistogram();
  ASSERT_EQ(buckets.size(), 3u);
  EXPECT_EQ(countOf(buckets, "Short (<1h)"), 1u);
  EXPECT_EQ(countOf(buckets, "Mid (1-3h)"), 2u);
  EXPECT_EQ(countOf(buckets, "Long (>3h)"), 2u);
}

TEST(VisitLedger, FinalBucketIsOpenEnded) {
  vector<DurationBucket> buckets = {
    {"quick", minutes(0), minutes(30)},
    {"rest", minutes(30), minutes(60)},
  };
  auto counts = durationHistogram({minutes(10), minutes(30), minutes(240)}, buckets);
  EXPECT_EQ(countOf(counts, "quick"), 1u);
  EXPECT_EQ(countOf(counts, "rest"), 2u);
}

TEST(VisitLedger, EditPatchesFieldsWithoutRecomputing) {
  VisitLedger ledger(300);
  ledger.append(visit("1", "2026-10-17T08:00:00Z", "2026-10-17T09:00:00Z", 500, 60));

  TransactionPatch patch;
  patch.totalFee = 800;
  patch.driverName = "Uwase Aline";
  Transaction t = ledger.edit("1", patch);
  EXPECT_EQ(t.totalFee, 800);
  EXPECT_EQ(t.durationMinutes, 60);
  EXPECT_EQ(ledger.findById("1")->driverName, "Uwase Aline");
  EXPECT_EQ(ledger.revenueTotal(), 800);
}

TEST(VisitLedger, EditKeepsInvariants) {
  VisitLedger ledger(300);
  ledger.append(visit("1", "2026-10-17T08:00:00Z", "2026-10-17T09:00:00Z", 500));

  TransactionPatch cheap;
  cheap.totalFee = 100;
  EXPECT_PARKING_ERROR(ledger.edit("1", cheap), ErrorKind::InvalidTransaction);

  TransactionPatch backwards;
  backwards.exitTime = at("2026-10-17T07:00:00Z");
  EXPECT_PARKING_ERROR(ledger.edit("1", backwards), ErrorKind::InvalidTransaction);

  EXPECT_EQ(ledger.findById("1")->totalFee, 500);
  EXPECT_PARKING_ERROR(ledger.edit("nope", cheap), ErrorKind::NotFound);
}

TEST(VisitLedger, RemoveRequiresAnExistingTransaction) {
  VisitLedger ledger(300);
  ledger.append(visit("1", "2026-10-17T08:00:00Z", "2026-10-17T09:00:00Z", 500));
  ledger.remove("1");
  EXPECT_EQ(ledger.countAll(), 0u);
  EXPECT_PARKING_ERROR(ledger.remove("1"), ErrorKind::NotFound);
}

TEST(VisitLedger, RecentAndSearch) {
  VisitLedger ledger(300);
  ledger.append(visit("1", "2026-10-17T08:00:00Z", "2026-10-17T09:00:00Z", 500));
  ledger.append(visit("2", "2026-10-17T08:00:00Z", "2026-10-17T09:00:00Z", 500));
  ledger.append(visit("3", "2026-10-17T08:00:00Z", "2026-10-17T09:00:00Z", 500));

  auto last = ledger.recent(2);
  ASSERT_EQ(last.size(), 2u);
  EXPECT_EQ(last[0].id, "2");
  EXPECT_EQ(last[1].id, "3");
  EXPECT_EQ(ledger.recent(10).size(), 3u);

  EXPECT_EQ(ledger.search("rab2").size(), 1u);
  EXPECT_EQ(ledger.search("DRIVER").size(), 3u);
  EXPECT_TRUE(ledger.search("RAC").empty());
}

TEST(VisitLedger, ReplaceAllValidatesEveryRecord) {
  VisitLedger ledger(300);
  vector<Transaction> backwards = {
    visit("1", "2026-10-17T08:00:00Z", "2026-10-17T09:00:00Z", 500),
    visit("2", "2026-10-17T09:00:00Z", "2026-10-17T08:00:00Z", 500),
  };
  EXPECT_PARKING_ERROR(ledger.replaceAll(backwards), ErrorKind::InvalidTransaction);

  vector<Transaction> negative = {visit("3", "2026-10-17T08:00:00Z", "2026-10-17T09:00:00Z", -5)};
  EXPECT_PARKING_ERROR(ledger.replaceAll(negative), ErrorKind::InvalidTransaction);
  EXPECT_EQ(ledger.countAll(), 0u);
}

TEST(VisitLedger, HistoryBilledUnderAnOlderTariffIsKept) {
  VisitLedger ledger(1000);
  ledger.replaceAll({visit("1", "2026-10-17T08:00:00Z", "2026-10-17T09:00:00Z", 500)});
  EXPECT_EQ(ledger.revenueTotal(), 500);

  TransactionPatch rename;
  rename.driverName = "Uwase Aline";
  EXPECT_EQ(ledger.edit("1", rename).totalFee, 500);

  TransactionPatch refee;
  refee.totalFee = 600;
  EXPECT_PARKING_ERROR(ledger.edit("1", refee), ErrorKind::InvalidTransaction);
  EXPECT_PARKING_ERROR(
    ledger.append(visit("2", "2026-10-17T08:00:00Z", "2026-10-17T09:00:00Z", 500)),
    ErrorKind::InvalidTransaction);
}
