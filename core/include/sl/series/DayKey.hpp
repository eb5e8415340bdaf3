#pragma once
#include <cstdint>
#include <string>

namespace sl {

// Canonical date key: UTC calendar days since 1970-01-01.
// Every emitted series is sorted and joined on this value; display strings
// are produced separately by formatDayKey().
using DayKey = std::int32_t;

struct CivilDate {
  int year{1970};
  int month{1};  // 1..12
  int day{1};    // 1..31
};

struct IsoWeek {
  int isoYear{1970};
  int week{1};   // 1..53
};

DayKey makeDayKey(int year, int month, int day);
CivilDate civilFromDayKey(DayKey key);

// Floors to the UTC day containing the instant.
DayKey dayKeyFromEpochSeconds(double epochSeconds);
double epochSecondsFromDayKey(DayKey key);

// Accepts "YYYY-MM-DD", optionally followed by a "T..." time part which is
// ignored. Returns false on anything else (including impossible dates).
bool parseDayKey(const std::string& text, DayKey& out);

// "YYYY-MM-DD"
std::string formatDayKey(DayKey key);

// Presentation-only label via strftime (e.g. "%d %b %Y").
std::string formatDayKey(DayKey key, const char* fmt);

// ISO-8601 weekday: Monday = 1 ... Sunday = 7.
int isoWeekday(DayKey key);
IsoWeek isoWeekOf(DayKey key);

} // namespace sl
