#pragma once
#include "sl/series/Types.hpp"

#include <algorithm>
#include <cstddef>
#include <vector>

namespace sl {

// Date-keyed access over day-sorted point vectors. Derived series start at
// different offsets (EMA(200) begins 199 bars after the raw series), so any
// component combining two series goes through joinByDate() instead of
// indexing positionally.

inline bool isDefinedPoint(const PricePoint&) { return true; }
inline bool isDefinedPoint(const BandPoint&) { return true; }
inline bool isDefinedPoint(const IndicatorPoint& p) { return p.value.has_value(); }

template <typename L, typename R>
struct JoinedPoint {
  DayKey day{0};
  L left;
  R right;
};

// A joined pair is itself a dated point, so joins can be chained.
template <typename L, typename R>
bool isDefinedPoint(const JoinedPoint<L, R>&) { return true; }

// Pairs for every day present and defined in both inputs, in day order.
// Both inputs must be strictly ascending by day.
template <typename L, typename R>
std::vector<JoinedPoint<L, R>> joinByDate(const std::vector<L>& a,
                                          const std::vector<R>& b) {
  std::vector<JoinedPoint<L, R>> out;
  out.reserve(std::min(a.size(), b.size()));

  std::size_t i = 0, j = 0;
  while (i < a.size() && j < b.size()) {
    if (a[i].day < b[j].day) { ++i; continue; }
    if (b[j].day < a[i].day) { ++j; continue; }
    if (isDefinedPoint(a[i]) && isDefinedPoint(b[j])) {
      out.push_back({a[i].day, a[i], b[j]});
    }
    ++i;
    ++j;
  }
  return out;
}

// Binary search; nullptr when the day is not in the series.
template <typename P>
const P* findByDay(const std::vector<P>& series, DayKey day) {
  auto it = std::lower_bound(series.begin(), series.end(), day,
                             [](const P& p, DayKey d) { return p.day < d; });
  if (it == series.end() || it->day != day) return nullptr;
  return &*it;
}

template <typename P>
bool isStrictlyAscending(const std::vector<P>& series) {
  for (std::size_t i = 1; i < series.size(); i++) {
    if (!(series[i - 1].day < series[i].day)) return false;
  }
  return true;
}

inline IndicatorSeries definedOnly(const IndicatorSeries& series) {
  IndicatorSeries out;
  out.reserve(series.size());
  for (const auto& p : series) {
    if (p.value) out.push_back(p);
  }
  return out;
}

} // namespace sl
