#include "smartpark/insights.h"

#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "smartpark/stateCodec.h"

using namespace std;
using json = nlohmann::json;

namespace smartpark {

const char* const InsightService::kFallback =
  "Unable to generate insights at the moment. Please check your connection.";

json snapshotToJson(const InsightSnapshot& snapshot) {
  return json{
    {"facility", snapshot.facilityName},
    {"stats", snapshot.stats},
    {"recentTransactions", snapshot.recent},
    {"request", "Provide a brief (max 100 words) summary of performance and "
                "one actionable tip for efficiency."},
  };
}

CommandInsightProvider::CommandInsightProvider(string command) : command_(std::move(command)) {}

string CommandInsightProvider::summarize(const InsightSnapshot& snapshot) {
  char path[] = "/tmp/smartpark-snapshot-XXXXXX";
  int fd = mkstemp(path);
  if (fd < 0) throw runtime_error("could not create snapshot file");
  close(fd);

  {
    ofstream out(path, ios::trunc);
    out << snapshotToJson(snapshot).dump();
    if (!out) {
      unlink(path);
      throw runtime_error("could not write snapshot file");
    }
  }

  string cmd = command_ + " < '" + path + "'";
  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    unlink(path);
    throw runtime_error("could not run insights command");
  }

  string output;
  char buf[512];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), pipe)) > 0) output.append(buf, n);
  int status = pclose(pipe);
  unlink(path);

  if (status != 0)
    throw runtime_error("insights command exited with status " + to_string(status));
  return output;
}

string InsightService::generate(const InsightSnapshot& snapshot) const {
  if (!provider_) return kFallback;
  try {
    string text = provider_->summarize(snapshot);
    if (text.find_first_not_of(" \t\r\n") == string::npos) return kFallback;
    return text;
  } catch (const exception& e) {
    spdlog::error("insight provider failed: {}", e.what());
    return kFallback;
  }
}

} // namespace smartpark
