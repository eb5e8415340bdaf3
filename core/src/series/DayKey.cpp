#include "sl/series/DayKey.hpp"

#include <cmath>
#include <cstdio>
#include <ctime>

namespace sl {

// Days-from-civil / civil-from-days on the proleptic Gregorian calendar,
// using 400-year eras so the arithmetic stays exact for negative keys.
DayKey makeDayKey(int year, int month, int day) {
  int y = year - (month <= 2 ? 1 : 0);
  int era = (y >= 0 ? y : y - 399) / 400;
  int yoe = y - era * 400;                                   // [0, 399]
  int mp = (month + 9) % 12;                                 // March = 0
  int doy = (153 * mp + 2) / 5 + day - 1;                    // [0, 365]
  int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;           // [0, 146096]
  return static_cast<DayKey>(era * 146097 + doe - 719468);
}

CivilDate civilFromDayKey(DayKey key) {
  int z = static_cast<int>(key) + 719468;
  int era = (z >= 0 ? z : z - 146096) / 146097;
  int doe = z - era * 146097;
  int yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  int doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  int mp = (5 * doy + 2) / 153;

  CivilDate c;
  c.day = doy - (153 * mp + 2) / 5 + 1;
  c.month = mp < 10 ? mp + 3 : mp - 9;
  c.year = yoe + era * 400 + (c.month <= 2 ? 1 : 0);
  return c;
}

DayKey dayKeyFromEpochSeconds(double epochSeconds) {
  return static_cast<DayKey>(std::floor(epochSeconds / 86400.0));
}

double epochSecondsFromDayKey(DayKey key) {
  return static_cast<double>(key) * 86400.0;
}

static bool readDigits(const std::string& s, std::size_t pos, std::size_t n, int& out) {
  if (pos + n > s.size()) return false;
  int v = 0;
  for (std::size_t i = pos; i < pos + n; i++) {
    char c = s[i];
    if (c < '0' || c > '9') return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  return true;
}

static int daysInMonth(int year, int month) {
  static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2) {
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return leap ? 29 : 28;
  }
  return kDays[month - 1];
}

bool parseDayKey(const std::string& text, DayKey& out) {
  int y = 0, m = 0, d = 0;
  if (!readDigits(text, 0, 4, y)) return false;
  if (text.size() < 10 || text[4] != '-' || text[7] != '-') return false;
  if (!readDigits(text, 5, 2, m) || !readDigits(text, 8, 2, d)) return false;
  if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') return false;
  if (m < 1 || m > 12) return false;
  if (d < 1 || d > daysInMonth(y, m)) return false;

  out = makeDayKey(y, m, d);
  return true;
}

std::string formatDayKey(DayKey key) {
  CivilDate c = civilFromDayKey(key);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", c.year, c.month, c.day);
  return buf;
}

std::string formatDayKey(DayKey key, const char* fmt) {
  CivilDate c = civilFromDayKey(key);
  std::tm tm{};
  tm.tm_year = c.year - 1900;
  tm.tm_mon = c.month - 1;
  tm.tm_mday = c.day;
  tm.tm_wday = isoWeekday(key) % 7;
  tm.tm_yday = static_cast<int>(key - makeDayKey(c.year, 1, 1));
  char buf[64];
  std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

int isoWeekday(DayKey key) {
  // 1970-01-01 was a Thursday.
  int w = (static_cast<int>(key) + 3) % 7;
  if (w < 0) w += 7;
  return w + 1;
}

IsoWeek isoWeekOf(DayKey key) {
  // The ISO week belongs to the year that contains its Thursday.
  DayKey thursday = key - (isoWeekday(key) - 1) + 3;
  IsoWeek out;
  out.isoYear = civilFromDayKey(thursday).year;
  out.week = static_cast<int>(thursday - makeDayKey(out.isoYear, 1, 1)) / 7 + 1;
  return out;
}

} // namespace sl
