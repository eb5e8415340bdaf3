#include "sl/signals/Crossover.hpp"
#include "sl/series/TemporalSeries.hpp"

#include <cstddef>

namespace sl {

CrossDirection strictCross(double prevA, double prevB, double curA, double curB) {
  if (prevA <= prevB && curA > curB) return CrossDirection::Up;
  if (prevA >= prevB && curA < curB) return CrossDirection::Down;
  return CrossDirection::None;
}

CrossoverResult detectGoldenDeathCross(const PriceSeries& prices,
                                       const IndicatorSeries& fast,
                                       const IndicatorSeries& slow) {
  CrossoverResult result;
  if (prices.empty()) return result;

  auto averages = joinByDate(fast, slow);
  auto joined = joinByDate(averages, prices);

  bool zoneOpen = false;
  DayKey zoneStart = 0;
  ZoneKind zoneKind = ZoneKind::Golden;

  for (std::size_t k = 1; k < joined.size(); k++) {
    const auto& prev = joined[k - 1];
    const auto& cur = joined[k];
    double prevFast = *prev.left.left.value;
    double prevSlow = *prev.left.right.value;
    double curFast = *cur.left.left.value;
    double curSlow = *cur.left.right.value;

    CrossDirection dir = strictCross(prevFast, prevSlow, curFast, curSlow);
    if (dir != CrossDirection::None) {
      bool golden = (dir == CrossDirection::Up);
      result.signals.push_back({cur.day, golden ? SignalKind::Golden : SignalKind::Death,
                                cur.right.close});
      if (zoneOpen) result.zones.push_back({zoneStart, cur.day, zoneKind});
      zoneOpen = true;
      zoneStart = cur.day;
      zoneKind = golden ? ZoneKind::Golden : ZoneKind::Death;
    } else if (!zoneOpen) {
      zoneOpen = true;
      zoneStart = cur.day;
      zoneKind = (curFast > curSlow) ? ZoneKind::Golden : ZoneKind::Death;
    }
  }

  if (zoneOpen) result.zones.push_back({zoneStart, prices.back().day, zoneKind});
  return result;
}

} // namespace sl
