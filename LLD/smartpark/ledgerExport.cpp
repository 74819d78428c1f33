#include "smartpark/ledgerExport.h"

#include <fstream>

#include <spdlog/spdlog.h>

#include "smartpark/errors.h"

using namespace std;

namespace smartpark {

namespace {

string quoted(const string& field) {
  string out = "\"";
  for (char c : field) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

} // namespace

void writeLedgerCsv(ostream& out, const vector<Transaction>& transactions,
                    chrono::minutes utcOffset) {
  out << "Plate Number,Driver Name,Entry Time,Exit Time,Duration (min),Total Fee (RWF),Slot Number\n";
  for (const auto& t : transactions) {
    out << quoted(t.plateNumber) << ','
        << quoted(t.driverName) << ','
        << quoted(formatDateTime(t.entryTime, utcOffset)) << ','
        << quoted(formatDateTime(t.exitTime, utcOffset)) << ','
        << t.durationMinutes << ','
        << t.totalFee << ','
        << quoted(t.slotNumber) << '\n';
  }
}

void exportLedgerCsv(const string& path, const vector<Transaction>& transactions,
                     chrono::minutes utcOffset) {
  ofstream out(path, ios::trunc);
  if (!out) throw ParkingError(ErrorKind::StorageFailure, "could not open " + path);
  writeLedgerCsv(out, transactions, utcOffset);
  out.flush();
  if (!out) throw ParkingError(ErrorKind::StorageFailure, "write failed for " + path);
  spdlog::info("exported {} transactions to {}", transactions.size(), path);
}

string defaultExportFileName(TimePoint now, chrono::minutes utcOffset) {
  return "SmartPark_Ledger_" + formatDay(dayNumber(now, utcOffset)) + ".csv";
}

} // namespace smartpark
