#ifndef SMARTPARK_LEDGER_EXPORT_H
#define SMARTPARK_LEDGER_EXPORT_H

#include <chrono>
#include <ostream>
#include <string>
#include <vector>

#include "smartpark/models.h"

namespace smartpark {

// Plate Number, Driver Name, Entry Time, Exit Time, Duration (min),
// Total Fee (RWF), Slot Number; one row per transaction in the given order.
void writeLedgerCsv(std::ostream& out, const std::vector<Transaction>& transactions,
                    std::chrono::minutes utcOffset);

// Throws ParkingError(StorageFailure) when the file cannot be written.
void exportLedgerCsv(const std::string& path, const std::vector<Transaction>& transactions,
                     std::chrono::minutes utcOffset);

// SmartPark_Ledger_2026-10-17.csv
std::string defaultExportFileName(TimePoint now, std::chrono::minutes utcOffset);

} // namespace smartpark

#endif // SMARTPARK_LEDGER_EXPORT_H
