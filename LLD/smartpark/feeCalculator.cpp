#include "smartpark/feeCalculator.h"

#include <algorithm>

#include "smartpark/errors.h"

using namespace std;

namespace smartpark {

namespace {

constexpr long long kMillisPerHour = 60LL * 60 * 1000;

// checked at clock precision, before any rounding
TimePoint::duration elapsed(TimePoint entryTime, TimePoint now) {
  auto d = now - entryTime;
  if (d < d.zero()) {
    throw ParkingError(ErrorKind::NegativeDuration,
                       "now (" + formatIsoTime(now) + ") is before entry time (" +
                       formatIsoTime(entryTime) + ")");
  }
  return d;
}

} // namespace

Money computeFee(TimePoint entryTime, TimePoint now, Money hourlyRate, Money minFee) {
  long long ms = chrono::ceil<chrono::milliseconds>(elapsed(entryTime, now)).count();
  // integer ceiling, exact for any partial hour
  long long billedHours = (ms + kMillisPerHour - 1) / kMillisPerHour;
  return max(billedHours * hourlyRate, minFee);
}

Money computeFee(TimePoint entryTime, TimePoint now, const Tariff& tariff) {
  return computeFee(entryTime, now, tariff.hourlyRate, tariff.minFee);
}

ElapsedTime formatDuration(TimePoint entryTime, TimePoint now) {
  long long total = chrono::floor<chrono::seconds>(elapsed(entryTime, now)).count();
  ElapsedTime e;
  e.hours = total / 3600;
  e.minutes = (total % 3600) / 60;
  e.seconds = total % 60;
  return e;
}

long long durationMinutes(TimePoint entryTime, TimePoint exitTime) {
  return chrono::floor<chrono::minutes>(elapsed(entryTime, exitTime)).count();
}

} // namespace smartpark
