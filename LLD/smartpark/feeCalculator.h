#ifndef SMARTPARK_FEE_CALCULATOR_H
#define SMARTPARK_FEE_CALCULATOR_H

#include "smartpark/clock.h"
#include "smartpark/models.h"

namespace smartpark {

struct Tariff {
  Money hourlyRate = 500;
  Money minFee = 300;
};

struct ElapsedTime {
  long long hours = 0;
  long long minutes = 0;
  long long seconds = 0;
};

/*
 Fee rule: every started hour is billed in full, then the minimum fee is
 applied as a floor.

   fee = max(ceil(elapsedHours) * hourlyRate, minFee)

 The live quote and the final charge both go through computeFee so they
 can never disagree. A negative interval throws NegativeDuration.
*/
Money computeFee(TimePoint entryTime, TimePoint now, Money hourlyRate, Money minFee);
Money computeFee(TimePoint entryTime, TimePoint now, const Tariff& tariff);

// Display breakdown of the same interval, each unit truncated.
ElapsedTime formatDuration(TimePoint entryTime, TimePoint now);

// floor((exit - entry) / 60s)
long long durationMinutes(TimePoint entryTime, TimePoint exitTime);

} // namespace smartpark

#endif // SMARTPARK_FEE_CALCULATOR_H
