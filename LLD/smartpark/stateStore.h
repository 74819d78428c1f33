#ifndef SMARTPARK_STATE_STORE_H
#define SMARTPARK_STATE_STORE_H

#include <cstddef>
#include <optional>
#include <string>

#include "smartpark/models.h"

namespace smartpark {

// Persistence boundary. The engine only needs load and save of the whole
// facility; failures surface as ParkingError(StorageFailure).
class IStateStore {
public:
  virtual ~IStateStore() = default;
  // nullopt when nothing has been saved yet
  virtual std::optional<FacilityState> load() = 0;
  virtual void save(const FacilityState& state) = 0;
};

// One JSON document on disk. Saves go to a sibling temp file that is
// renamed over the target, so a reader sees the old or the new state.
class JsonFileStateStore : public IStateStore {
public:
  explicit JsonFileStateStore(std::string path);

  std::optional<FacilityState> load() override;
  void save(const FacilityState& state) override;

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

class InMemoryStateStore : public IStateStore {
public:
  std::optional<FacilityState> load() override { return state_; }
  void save(const FacilityState& state) override { state_ = state; ++saves_; }

  std::size_t saveCount() const { return saves_; }

private:
  std::optional<FacilityState> state_;
  std::size_t saves_ = 0;
};

} // namespace smartpark

#endif // SMARTPARK_STATE_STORE_H
