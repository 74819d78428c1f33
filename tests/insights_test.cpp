#include <stdexcept>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "smartpark/insights.h"
#include "testSupport.h"

using namespace std;
using namespace smartpark;
using json = nlohmann::json;

namespace {

InsightSnapshot sample() {
  InsightSnapshot snap;
  snap.facilityName = "SmartPark Rubavu";
  snap.stats.totalRevenue = 4500;
  snap.stats.totalEntries = 7;
  snap.stats.availableSlots = 20;
  snap.stats.occupiedSlots = 4;

  Transaction t;
  t.id = "tx-1";
  t.plateNumber = "RAB123A";
  t.driverName = "Mugisha Eric";
  t.entryTime = at("2026-10-17T06:00:00.000Z");
  t.exitTime = at("2026-10-17T07:00:00.000Z");
  t.durationMinutes = 60;
  t.totalFee = 500;
  t.slotNumber = "A01";
  snap.recent.push_back(t);
  return snap;
}

class FixedProvider : public IInsightProvider {
public:
  explicit FixedProvider(string reply) : reply_(std::move(reply)) {}
  string summarize(const InsightSnapshot& snapshot) override {
    seenRecent = snapshot.recent.size();
    return reply_;
  }
  size_t seenRecent = 0;

private:
  string reply_;
};

class BrokenProvider : public IInsightProvider {
public:
  string summarize(const InsightSnapshot&) override {
    throw runtime_error("connection refused");
  }
};

} // namespace

TEST(InsightService, ReturnsTheProviderText) {
  FixedProvider provider("Occupancy is steady; open A-row first.");
  InsightService svc(&provider);
  EXPECT_EQ(svc.generate(sample()), "Occupancy is steady; open A-row first.");
  EXPECT_EQ(provider.seenRecent, 1u);
}

TEST(InsightService, FallsBackWithoutAProvider) {
  InsightService svc(nullptr);
  EXPECT_EQ(svc.generate(sample()), InsightService::kFallback);
}

TEST(InsightService, FallsBackWhenTheProviderFails) {
  BrokenProvider broken;
  EXPECT_EQ(InsightService(&broken).generate(sample()), InsightService::kFallback);

  FixedProvider blank("  \n");
  EXPECT_EQ(InsightService(&blank).generate(sample()), InsightService::kFallback);
}

TEST(InsightSnapshot, JsonCarriesStatsAndRecentVisits) {
  json j = snapshotToJson(sample());
  EXPECT_EQ(j["facility"], "SmartPark Rubavu");
  EXPECT_EQ(j["stats"]["totalRevenue"], 4500);
  EXPECT_EQ(j["stats"]["occupiedSlots"], 4);
  ASSERT_EQ(j["recentTransactions"].size(), 1u);
  EXPECT_EQ(j["recentTransactions"][0]["plateNumber"], "RAB123A");
  EXPECT_TRUE(j.contains("request"));
}

TEST(CommandInsightProvider, PipesTheSnapshotToTheCommand) {
  CommandInsightProvider provider("cat");
  json echoed = json::parse(provider.summarize(sample()));
  EXPECT_EQ(echoed["facility"], "SmartPark Rubavu");
  EXPECT_EQ(echoed["stats"]["totalEntries"], 7);
}

TEST(CommandInsightProvider, FailingCommandFallsBack) {
  CommandInsightProvider provider("false");
  EXPECT_THROW(provider.summarize(sample()), runtime_error);
  EXPECT_EQ(InsightService(&provider).generate(sample()), InsightService::kFallback);
}
