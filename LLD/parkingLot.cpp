#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "smartpark/clock.h"
#include "smartpark/config.h"
#include "smartpark/errors.h"
#include "smartpark/insights.h"
#include "smartpark/ledgerExport.h"
#include "smartpark/logging.h"
#include "smartpark/parkingService.h"
#include "smartpark/stateStore.h"
using namespace std;
using namespace smartpark;

/*
 1) Console front end for one facility. Every command maps onto one
    ParkingService call:
    - checkin plate driver phone [slot]  -> checkIn
    - checkout slot                      -> checkOut
    - purge slot                         -> forcedRelease (asks first)
    - active / ledger / stats / report   -> read-only projections
    Slots are given by label (A01) or id (slot-1).
*/

/*
 2) Persistence: state is saved every save_every changes and on quit/EOF.
*/

namespace {

const char* kHelp =
  "commands:\n"
  "  slots                                  list every slot\n"
  "  checkin <plate> <driver> <phone> [slot] register an arrival\n"
  "  checkout <slot>                        settle a departure\n"
  "  quote <slot>                           live fee for a parked vehicle\n"
  "  purge <slot>                           free a slot without billing\n"
  "  addslot <label>                        add a slot\n"
  "  maintenance <slot> on|off              take a slot out of service\n"
  "  active [query]                         parked vehicles, live fees\n"
  "  ledger [query]                         settled visits\n"
  "  edit <id> field=value...               correct a transaction\n"
  "                                         (plate, driver, entry, exit, minutes, fee, slot)\n"
  "  delete <id>                            remove a transaction\n"
  "  stats                                  facility totals\n"
  "  report                                 revenue, traffic and duration breakdown\n"
  "  export [file]                          write the ledger as CSV\n"
  "  insights                               operations summary\n"
  "  save                                   write state now\n"
  "  reset                                  factory reset\n"
  "  quit\n";

vector<string> tokenize(const string& line) {
  istringstream in(line);
  vector<string> out;
  string tok;
  while (in >> quoted(tok)) out.push_back(tok);
  return out;
}

bool confirm(const string& question) {
  cout << question << " [y/N] " << flush;
  string answer;
  if (!getline(cin, answer)) return false;
  return answer == "y" || answer == "Y" || answer == "yes";
}

string money(Money m) {
  return to_string(m) + " RWF";
}

class Console {
public:
  Console(ParkingService& svc, InsightService& insights)
    : svc_(svc), insights_(insights) {}

  // false once the user asked to leave
  bool dispatch(const vector<string>& args);

private:
  Slot slotArg(const string& ref) {
    auto slot = svc_.resolveSlot(ref);
    if (!slot) throw ParkingError(ErrorKind::NotFound, "no slot " + ref);
    return *slot;
  }

  void require(const vector<string>& args, size_t n, const char* usage) {
    if (args.size() < n) throw ParkingError(ErrorKind::InvalidInput, string("usage: ") + usage);
  }

  void listSlots();
  void checkIn(const vector<string>& args);
  void checkOut(const vector<string>& args);
  void listActive(const string& query);
  void listLedger(const string& query);
  void edit(const vector<string>& args);
  void printStats();
  void printReport();
  void exportLedger(const vector<string>& args);

  ParkingService& svc_;
  InsightService& insights_;
};

bool Console::dispatch(const vector<string>& args) {
  const string& cmd = args[0];
  string rest = args.size() > 1 ? args[1] : "";

  if (cmd == "help") cout << kHelp;
  else if (cmd == "slots") listSlots();
  else if (cmd == "checkin") checkIn(args);
  else if (cmd == "checkout") checkOut(args);
  else if (cmd == "quote") {
    require(args, 2, "quote <slot>");
    cout << money(svc_.quote(slotArg(rest).id)) << "\n";
  }
  else if (cmd == "purge") {
    require(args, 2, "purge <slot>");
    Slot slot = slotArg(rest);
    if (!confirm("Force purge " + slot.number + "? The visit will not be billed.")) return true;
    Occupant dropped = svc_.forcedRelease(slot.id);
    cout << "released " << slot.number << ", " << dropped.plateNumber << " discarded\n";
  }
  else if (cmd == "addslot") {
    require(args, 2, "addslot <label>");
    Slot slot = svc_.addSlot(rest);
    cout << "added " << slot.number << " (" << slot.id << ")\n";
  }
  else if (cmd == "maintenance") {
    require(args, 3, "maintenance <slot> on|off");
    if (args[2] != "on" && args[2] != "off")
      throw ParkingError(ErrorKind::InvalidInput, "usage: maintenance <slot> on|off");
    svc_.setMaintenance(slotArg(rest).id, args[2] == "on");
  }
  else if (cmd == "active") listActive(rest);
  else if (cmd == "ledger") listLedger(rest);
  else if (cmd == "edit") edit(args);
  else if (cmd == "delete") {
    require(args, 2, "delete <id>");
    if (!confirm("Delete transaction " + rest + "?")) return true;
    svc_.deleteTransaction(rest);
  }
  else if (cmd == "stats") printStats();
  else if (cmd == "report") printReport();
  else if (cmd == "export") exportLedger(args);
  else if (cmd == "insights") cout << insights_.generate(svc_.snapshot()) << "\n";
  else if (cmd == "save") svc_.save();
  else if (cmd == "reset") {
    if (!confirm("Purge all facility data?")) return true;
    svc_.factoryReset();
    svc_.save();
  }
  else if (cmd == "quit" || cmd == "exit") return false;
  else cout << "unknown command '" << cmd << "', try help\n";
  return true;
}

void Console::listSlots() {
  for (const auto& s : svc_.slots()) {
    cout << left << setw(8) << s.number << setw(12) << toString(s.status());
    if (auto occ = s.occupant()) cout << occ->plateNumber;
    cout << "\n";
  }
}

void Console::checkIn(const vector<string>& args) {
  require(args, 4, "checkin <plate> <driver> <phone> [slot]");
  optional<string> requested;
  if (args.size() > 4) requested = slotArg(args[4]).id;
  Occupant occ = svc_.checkIn(args[1], args[2], args[3], requested);
  auto slot = svc_.resolveSlot(occ.slotId);
  cout << occ.plateNumber << " parked at " << (slot ? slot->number : occ.slotId)
       << " (" << formatDateTime(occ.entryTime, svc_.config().utcOffset) << ")\n";
}

void Console::checkOut(const vector<string>& args) {
  require(args, 2, "checkout <slot>");
  Slot slot = slotArg(args[1]);
  if (auto occ = slot.occupant()) {
    if (!confirm("Settle " + occ->plateNumber + " for " + money(svc_.quote(slot.id)) + "?"))
      return;
  }
  Transaction tx = svc_.checkOut(slot.id);
  cout << tx.plateNumber << " left " << tx.slotNumber << " after " << tx.durationMinutes
       << " min, paid " << money(tx.totalFee) << "\n";
}

void Console::listActive(const string& query) {
  auto visits = query.empty() ? svc_.liveVisits() : svc_.searchActive(query);
  if (visits.empty()) {
    cout << "no vehicles parked\n";
    return;
  }
  for (const auto& v : visits) {
    cout << left << setw(6) << v.slotNumber << setw(12) << v.occupant.plateNumber
         << setw(20) << v.occupant.driverName
         << v.elapsed.hours << "h " << v.elapsed.minutes << "m " << v.elapsed.seconds << "s  "
         << money(v.liveFee) << "\n";
  }
}

void Console::listLedger(const string& query) {
  auto txs = query.empty() ? svc_.transactions() : svc_.searchLedger(query);
  if (txs.empty()) {
    cout << "no transactions\n";
    return;
  }
  auto offset = svc_.config().utcOffset;
  for (const auto& t : txs) {
    cout << t.id << "  " << left << setw(12) << t.plateNumber << setw(20) << t.driverName
         << formatDateTime(t.entryTime, offset) << " -> " << formatDateTime(t.exitTime, offset)
         << "  " << t.slotNumber << "  " << t.durationMinutes << " min  " << money(t.totalFee) << "\n";
  }
}

void Console::edit(const vector<string>& args) {
  require(args, 3, "edit <id> field=value...");
  TransactionPatch patch;
  for (size_t i = 2; i < args.size(); ++i) {
    auto eq = args[i].find('=');
    if (eq == string::npos)
      throw ParkingError(ErrorKind::InvalidInput, "expected field=value, got " + args[i]);
    string field = args[i].substr(0, eq), value = args[i].substr(eq + 1);

    auto timeValue = [&]() {
      auto t = parseIsoTime(value);
      if (!t) throw ParkingError(ErrorKind::InvalidInput, "bad timestamp " + value);
      return *t;
    };
    auto numberValue = [&]() {
      try {
        return stoll(value);
      } catch (const exception&) {
        throw ParkingError(ErrorKind::InvalidInput, "bad number " + value);
      }
    };

    if (field == "plate") patch.plateNumber = value;
    else if (field == "driver") patch.driverName = value;
    else if (field == "entry") patch.entryTime = timeValue();
    else if (field == "exit") patch.exitTime = timeValue();
    else if (field == "minutes") patch.durationMinutes = numberValue();
    else if (field == "fee") patch.totalFee = numberValue();
    else if (field == "slot") patch.slotNumber = value;
    else throw ParkingError(ErrorKind::InvalidInput, "unknown field " + field);
  }
  Transaction t = svc_.editTransaction(args[1], patch);
  cout << "updated " << t.id << "\n";
}

void Console::printStats() {
  FacilityStats st = svc_.stats();
  cout << svc_.config().facilityName << "\n"
       << "  revenue:     " << money(st.totalRevenue) << "\n"
       << "  entries:     " << st.totalEntries << "\n"
       << "  available:   " << st.availableSlots << "\n"
       << "  occupied:    " << st.occupiedSlots << "\n"
       << "  maintenance: " << st.maintenanceSlots << "\n";
}

void Console::printReport() {
  cout << "revenue, last 7 days\n";
  for (const auto& d : svc_.revenueLastDays(7))
    cout << "  " << d.date << "  " << money(d.amount) << "\n";

  cout << "check-ins by hour\n";
  auto hours = svc_.entriesByHourOfDay();
  for (size_t h = 0; h < hours.size(); ++h)
    if (hours[h] > 0) cout << "  " << setw(2) << setfill('0') << h << setfill(' ') << ":00  " << hours[h] << "\n";

  cout << "parked now\n";
  for (const auto& b : svc_.activeDurationHistogram())
    cout << "  " << left << setw(14) << b.name << b.count << "\n";

  cout << "settled visits\n";
  for (const auto& b : svc_.ledgerDurationHistogram())
    cout << "  " << left << setw(14) << b.name << b.count << "\n";
}

void Console::exportLedger(const vector<string>& args) {
  auto txs = svc_.transactions();
  if (txs.empty()) {
    cout << "ledger is empty, nothing to export\n";
    return;
  }
  auto offset = svc_.config().utcOffset;
  string path = args.size() > 1 ? args[1] : defaultExportFileName(svc_.now(), offset);
  exportLedgerCsv(path, txs, offset);
  cout << "wrote " << txs.size() << " rows to " << path << "\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    FacilityConfig cfg = argc > 1 ? loadConfig(argv[1]) : FacilityConfig{};
    initLogging(cfg.logLevel);

    SystemClock clock;
    JsonFileStateStore store(cfg.stateFile);
    ParkingService svc(cfg, clock, store);
    svc.load();

    unique_ptr<IInsightProvider> provider;
    if (!cfg.insightsCommand.empty())
      provider = make_unique<CommandInsightProvider>(cfg.insightsCommand);
    InsightService insights(provider.get());

    Console console(svc, insights);
    cout << cfg.facilityName << " (" << cfg.tariff.hourlyRate << " RWF/h, minimum "
         << cfg.tariff.minFee << " RWF). Type help for commands.\n";

    string line;
    while (cout << "> " << flush, getline(cin, line)) {
      auto args = tokenize(line);
      if (args.empty()) continue;
      try {
        if (!console.dispatch(args)) break;
        svc.saveIfDue();
      } catch (const ParkingError& e) {
        cout << "error (" << toString(e.kind()) << "): " << e.what() << "\n";
      }
    }

    svc.saveIfDirty();
  } catch (const std::exception& e) {
    cerr << "[FATAL] " << e.what() << "\n";
    return 1;
  }
  return 0;
}
