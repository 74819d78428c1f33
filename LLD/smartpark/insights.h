#ifndef SMARTPARK_INSIGHTS_H
#define SMARTPARK_INSIGHTS_H

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "smartpark/models.h"

namespace smartpark {

// Read-only view handed to an external summarizer.
struct InsightSnapshot {
  std::string facilityName;
  FacilityStats stats;
  std::vector<Transaction> recent;
};

nlohmann::json snapshotToJson(const InsightSnapshot& snapshot);

// Whatever turns a snapshot into prose. May throw; InsightService
// absorbs the failure into the fallback text.
class IInsightProvider {
public:
  virtual ~IInsightProvider() = default;
  virtual std::string summarize(const InsightSnapshot& snapshot) = 0;
};

// Runs a shell command with the snapshot JSON on stdin and returns its
// stdout. A non-zero exit status is a failure.
class CommandInsightProvider : public IInsightProvider {
public:
  explicit CommandInsightProvider(std::string command);
  std::string summarize(const InsightSnapshot& snapshot) override;

private:
  std::string command_;
};

class InsightService {
public:
  static const char* const kFallback;

  // provider may be null when no summarizer is configured
  explicit InsightService(IInsightProvider* provider) : provider_(provider) {}

  std::string generate(const InsightSnapshot& snapshot) const;

private:
  IInsightProvider* provider_;
};

} // namespace smartpark

#endif // SMARTPARK_INSIGHTS_H
