#include "sl/data/PeriodExtrema.hpp"

#include <cstddef>

namespace sl {

std::int32_t periodBucketKey(DayKey day, PeriodType period) {
  switch (period) {
    case PeriodType::Week: {
      IsoWeek w = isoWeekOf(day);
      return w.isoYear * 100 + w.week;
    }
    case PeriodType::Month: {
      CivilDate c = civilFromDayKey(day);
      return c.year * 100 + c.month;
    }
    case PeriodType::Year:
      return civilFromDayKey(day).year;
  }
  return 0;
}

std::vector<Peak> aggregatePeriodExtrema(const PriceSeries& series, PeriodType period) {
  std::vector<Peak> peaks;
  std::size_t count = series.size();

  // Sorted input: buckets are runs of equal keys.
  std::size_t start = 0;
  while (start < count) {
    std::int32_t key = periodBucketKey(series[start].day, period);
    std::size_t end = start + 1;
    while (end < count && periodBucketKey(series[end].day, period) == key) ++end;

    const PricePoint* highBar = &series[start];
    const PricePoint* lowBar = &series[start];
    for (std::size_t i = start + 1; i < end; ++i) {
      const PricePoint& p = series[i];
      if (p.highOrClose() > highBar->highOrClose()) highBar = &p;
      if (p.lowOrClose() < lowBar->lowOrClose()) lowBar = &p;
    }

    peaks.push_back({highBar->day, PeakKind::PeriodHigh, period, highBar->highOrClose()});
    peaks.push_back({lowBar->day, PeakKind::PeriodLow, period, lowBar->lowOrClose()});
    start = end;
  }

  return peaks;
}

} // namespace sl
