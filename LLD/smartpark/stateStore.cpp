#include "smartpark/stateStore.h"

#include <filesystem>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "smartpark/errors.h"
#include "smartpark/stateCodec.h"

using namespace std;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace smartpark {

JsonFileStateStore::JsonFileStateStore(string path) : path_(std::move(path)) {}

optional<FacilityState> JsonFileStateStore::load() {
  error_code ec;
  if (!fs::exists(path_, ec)) {
    spdlog::info("no saved state at {}", path_);
    return nullopt;
  }

  ifstream in(path_);
  if (!in) throw ParkingError(ErrorKind::StorageFailure, "could not open state file: " + path_);

  try {
    json j;
    in >> j;
    auto state = j.get<FacilityState>();
    spdlog::debug("loaded {} slots and {} transactions from {}",
                  state.slots.size(), state.transactions.size(), path_);
    return state;
  } catch (const json::exception& e) {
    throw ParkingError(ErrorKind::StorageFailure, "state file " + path_ + ": " + e.what());
  }
}

void JsonFileStateStore::save(const FacilityState& state) {
  string text;
  try {
    text = json(state).dump(2);
  } catch (const json::exception& e) {
    throw ParkingError(ErrorKind::StorageFailure, string("could not encode state: ") + e.what());
  }

  string tmp = path_ + ".tmp";
  {
    ofstream out(tmp, ios::trunc);
    if (!out) throw ParkingError(ErrorKind::StorageFailure, "could not write " + tmp);
    out << text << '\n';
    out.flush();
    if (!out) {
      out.close();
      error_code ignored;
      fs::remove(tmp, ignored);
      throw ParkingError(ErrorKind::StorageFailure, "write failed for " + tmp);
    }
  }

  error_code ec;
  fs::rename(tmp, path_, ec);
  if (ec) {
    string reason = ec.message();
    fs::remove(tmp, ec);
    throw ParkingError(ErrorKind::StorageFailure, "could not replace " + path_ + ": " + reason);
  }
  spdlog::debug("saved {} slots and {} transactions to {}",
                state.slots.size(), state.transactions.size(), path_);
}

} // namespace smartpark
