#include "smartpark/clock.h"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

using namespace std;

namespace smartpark {

namespace {

constexpr long long kMillisPerDay = 24LL * 60 * 60 * 1000;

long long floorDiv(long long a, long long b) {
  long long q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

long long toMillis(TimePoint t) {
  return chrono::duration_cast<chrono::milliseconds>(t.time_since_epoch()).count();
}

tm utcFields(long long seconds) {
  time_t tt = static_cast<time_t>(seconds);
  tm out{};
  gmtime_r(&tt, &out);
  return out;
}

} // namespace

TimePoint SystemClock::now() const {
  return chrono::time_point_cast<chrono::milliseconds>(chrono::system_clock::now());
}

string formatIsoTime(TimePoint t) {
  long long ms = toMillis(t);
  long long secs = floorDiv(ms, 1000);
  tm utc = utcFields(secs);
  char buf[40];
  snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
           utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
           utc.tm_hour, utc.tm_min, utc.tm_sec,
           static_cast<int>(ms - secs * 1000));
  return buf;
}

optional<TimePoint> parseIsoTime(const string& text) {
  istringstream in(text);
  tm fields{};
  in >> get_time(&fields, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) return nullopt;

  string rest;
  getline(in, rest);

  // optional fraction, kept to millisecond precision
  long long millis = 0;
  size_t pos = 0;
  if (pos < rest.size() && rest[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < rest.size() && isdigit(static_cast<unsigned char>(rest[pos]))) {
      if (digits < 3) millis = millis * 10 + (rest[pos] - '0');
      ++digits;
      ++pos;
    }
    if (digits == 0) return nullopt;
    for (; digits < 3; ++digits) millis *= 10;
  }
  if (rest.substr(pos) != "Z") return nullopt;

  time_t secs = timegm(&fields);
  return TimePoint(chrono::seconds(secs)) + chrono::milliseconds(millis);
}

long long dayNumber(TimePoint t, chrono::minutes utcOffset) {
  long long shifted = toMillis(t) + chrono::duration_cast<chrono::milliseconds>(utcOffset).count();
  return floorDiv(shifted, kMillisPerDay);
}

string formatDay(long long day) {
  tm utc = utcFields(day * 24 * 60 * 60);
  char buf[16];
  snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
           utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday);
  return buf;
}

int hourOfDay(TimePoint t, chrono::minutes utcOffset) {
  long long shifted = toMillis(t) + chrono::duration_cast<chrono::milliseconds>(utcOffset).count();
  long long intoDay = shifted - floorDiv(shifted, kMillisPerDay) * kMillisPerDay;
  return static_cast<int>(intoDay / (60LL * 60 * 1000));
}

string formatDateTime(TimePoint t, chrono::minutes utcOffset) {
  long long shifted = toMillis(t) + chrono::duration_cast<chrono::milliseconds>(utcOffset).count();
  tm local = utcFields(floorDiv(shifted, 1000));
  char buf[32];
  snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
           local.tm_year + 1900, local.tm_mon + 1, local.tm_mday,
           local.tm_hour, local.tm_min, local.tm_sec);
  return buf;
}

} // namespace smartpark
