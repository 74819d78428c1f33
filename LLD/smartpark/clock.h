#ifndef SMARTPARK_CLOCK_H
#define SMARTPARK_CLOCK_H

#include <chrono>
#include <optional>
#include <string>

namespace smartpark {

using TimePoint = std::chrono::system_clock::time_point;

/*
 Clock source: the only place the engine learns the current instant.
 Fee and duration math is a pure function of (entry, now), so tests swap
 in a ManualClock.
*/
class IClock {
public:
  virtual ~IClock() = default;
  virtual TimePoint now() const = 0;
};

// Wall clock truncated to milliseconds, the precision state is stored at.
class SystemClock : public IClock {
public:
  TimePoint now() const override;
};

class ManualClock : public IClock {
public:
  explicit ManualClock(TimePoint start) : now_(start) {}

  TimePoint now() const override { return now_; }
  void set(TimePoint t) { now_ = t; }
  void advance(std::chrono::milliseconds d) { now_ += d; }

private:
  TimePoint now_;
};

// "2026-10-17T08:05:00.000Z"
std::string formatIsoTime(TimePoint t);
std::optional<TimePoint> parseIsoTime(const std::string& text);

// Calendar helpers. utcOffset shifts UTC into the facility's local time.
long long dayNumber(TimePoint t, std::chrono::minutes utcOffset);
std::string formatDay(long long dayNumber);
int hourOfDay(TimePoint t, std::chrono::minutes utcOffset);
// "2026-10-17 10:05:00"
std::string formatDateTime(TimePoint t, std::chrono::minutes utcOffset);

} // namespace smartpark

#endif // SMARTPARK_CLOCK_H
