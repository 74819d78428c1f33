#include <sstream>

#include <gtest/gtest.h>

#include "smartpark/ledgerExport.h"
#include "testSupport.h"

using namespace std;
using namespace smartpark;
using chrono::minutes;

namespace {

Transaction visit(const string& plate, const string& driver, Money fee) {
  Transaction t;
  t.id = plate;
  t.plateNumber = plate;
  t.driverName = driver;
  t.entryTime = at("2026-10-17T08:00:00.000Z");
  t.exitTime = at("2026-10-17T09:30:45.000Z");
  t.durationMinutes = 90;
  t.totalFee = fee;
  t.slotNumber = "A07";
  return t;
}

const char* kHeader =
  "Plate Number,Driver Name,Entry Time,Exit Time,Duration (min),Total Fee (RWF),Slot Number\n";

} // namespace

TEST(LedgerExport, EmptyLedgerWritesOnlyTheHeader) {
  ostringstream out;
  writeLedgerCsv(out, {}, minutes(0));
  EXPECT_EQ(out.str(), kHeader);
}

TEST(LedgerExport, RowsFollowLedgerOrderInLocalTime) {
  ostringstream out;
  writeLedgerCsv(out, {visit("RAB123A", "Mugisha Eric", 1000), visit("RAC555B", "Uwase Aline", 500)},
                 minutes(120));
  EXPECT_EQ(out.str(),
            string(kHeader) +
            "\"RAB123A\",\"Mugisha Eric\",\"2026-10-17 10:00:00\",\"2026-10-17 11:30:45\",90,1000,\"A07\"\n"
            "\"RAC555B\",\"Uwase Aline\",\"2026-10-17 10:00:00\",\"2026-10-17 11:30:45\",90,500,\"A07\"\n");
}

TEST(LedgerExport, QuotesInsideFieldsAreDoubled) {
  ostringstream out;
  writeLedgerCsv(out, {visit("RAB123A", "Jean \"JJ\", Bosco", 1000)}, minutes(0));
  EXPECT_NE(out.str().find("\"Jean \"\"JJ\"\", Bosco\""), string::npos);
}

TEST(LedgerExport, DefaultFileNameUsesTheLocalDate) {
  EXPECT_EQ(defaultExportFileName(at("2026-10-17T23:30:00Z"), minutes(120)),
            "SmartPark_Ledger_2026-10-18.csv");
  EXPECT_EQ(defaultExportFileName(at("2026-10-17T23:30:00Z"), minutes(0)),
            "SmartPark_Ledger_2026-10-17.csv");
}

TEST(LedgerExport, UnwritablePathIsAStorageFailure) {
  EXPECT_PARKING_ERROR(exportLedgerCsv("/nonexistent-dir/ledger.csv", {visit("RAB123A", "X", 500)},
                                       minutes(0)),
                       ErrorKind::StorageFailure);
}
