#include "sl/signals/ThresholdSignals.hpp"
#include "sl/signals/Crossover.hpp"
#include "sl/series/TemporalSeries.hpp"

#include <cstddef>

namespace sl {

std::vector<Signal> detectRsiThresholdSignals(const PriceSeries& prices,
                                              const IndicatorSeries& rsi,
                                              double oversold, double overbought) {
  std::vector<Signal> signals;
  auto joined = joinByDate(rsi, prices);

  for (std::size_t k = 1; k < joined.size(); k++) {
    double prev = *joined[k - 1].left.value;
    double cur = *joined[k].left.value;
    const auto& bar = joined[k].right;

    if (strictCross(prev, oversold, cur, oversold) == CrossDirection::Up) {
      signals.push_back({bar.day, SignalKind::Buy, bar.close});
    } else if (strictCross(prev, overbought, cur, overbought) == CrossDirection::Down) {
      signals.push_back({bar.day, SignalKind::Sell, bar.close});
    }
  }
  return signals;
}

std::vector<Signal> detectMacdCrossSignals(const PriceSeries& prices,
                                           const MacdResult& macd) {
  std::vector<Signal> signals;
  auto lines = joinByDate(macd.macdLine, macd.signalLine);
  auto joined = joinByDate(lines, prices);

  for (std::size_t k = 1; k < joined.size(); k++) {
    const auto& prev = joined[k - 1].left;
    const auto& cur = joined[k].left;
    const auto& bar = joined[k].right;

    CrossDirection dir = strictCross(*prev.left.value, *prev.right.value,
                                     *cur.left.value, *cur.right.value);
    if (dir == CrossDirection::Up) {
      signals.push_back({bar.day, SignalKind::Buy, bar.close});
    } else if (dir == CrossDirection::Down) {
      signals.push_back({bar.day, SignalKind::Sell, bar.close});
    }
  }
  return signals;
}

std::vector<BandBreach> detectBandBreaches(const PriceSeries& prices,
                                           const BandSeries& bands) {
  std::vector<BandBreach> breaches;
  for (const auto& j : joinByDate(bands, prices)) {
    double close = j.right.close;
    if (close > j.left.upper) {
      breaches.push_back({j.day, BandBreachKind::Overbought, close});
    } else if (close < j.left.lower) {
      breaches.push_back({j.day, BandBreachKind::Oversold, close});
    }
  }
  return breaches;
}

} // namespace sl
