#include "sl/math/Indicators.hpp"
#include "sl/math/MovingAverage.hpp"
#include "sl/math/Statistics.hpp"
#include "sl/series/TemporalSeries.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace sl {

static double rsiFromAverages(double avgGain, double avgLoss) {
  if (avgLoss == 0.0) return 100.0;
  double rs = avgGain / avgLoss;
  return std::clamp(100.0 - 100.0 / (1.0 + rs), 0.0, 100.0);
}

IndicatorSeries computeRsi(const PriceSeries& series, int period) {
  IndicatorSeries rsi;
  int count = static_cast<int>(series.size());
  if (period < 1 || count < period + 1) return rsi;

  rsi.reserve(static_cast<std::size_t>(count - period));

  // Seed: mean gain/loss over the first `period` changes
  double avgGain = 0.0, avgLoss = 0.0;
  for (int i = 1; i <= period; i++) {
    double change = series[i].close - series[i - 1].close;
    if (change > 0) avgGain += change;
    else avgLoss -= change;
  }
  avgGain /= static_cast<double>(period);
  avgLoss /= static_cast<double>(period);
  rsi.push_back({series[period].day, rsiFromAverages(avgGain, avgLoss)});

  // Wilder's smoothing
  double p = static_cast<double>(period);
  for (int i = period + 1; i < count; i++) {
    double change = series[i].close - series[i - 1].close;
    if (change > 0) {
      avgGain = (avgGain * (p - 1.0) + change) / p;
      avgLoss = avgLoss * (p - 1.0) / p;
    } else {
      avgGain = avgGain * (p - 1.0) / p;
      avgLoss = (avgLoss * (p - 1.0) - change) / p;
    }
    rsi.push_back({series[i].day, rsiFromAverages(avgGain, avgLoss)});
  }

  return rsi;
}

std::vector<RsiPoint> computeRsiSmoothing(const IndicatorSeries& rsi,
                                          RsiSmoothingType type,
                                          int lookback, double mult) {
  std::vector<RsiPoint> out;
  std::vector<double> values;
  out.reserve(rsi.size());
  values.reserve(rsi.size());
  for (const auto& r : rsi) {
    if (!r.value) continue;
    out.push_back({r.day, *r.value, std::nullopt, std::nullopt, std::nullopt});
    values.push_back(*r.value);
  }

  int count = static_cast<int>(values.size());
  if (lookback < 1 || count < lookback) return out;

  auto ma = (type == RsiSmoothingType::Ema)
      ? emaValues(values.data(), count, lookback)
      : smaValues(values.data(), count, lookback);

  for (int i = lookback - 1; i < count; i++) {
    auto& pt = out[static_cast<std::size_t>(i)];
    pt.smoothing = ma[static_cast<std::size_t>(i)];
    if (type != RsiSmoothingType::SmaWithBands || !pt.smoothing) continue;

    double sd = populationStdDev(values.data() + (i - lookback + 1), lookback, *pt.smoothing);
    pt.upper = *pt.smoothing + mult * sd;
    pt.lower = *pt.smoothing - mult * sd;
  }

  return out;
}

MacdResult computeMacd(const PriceSeries& series, int fast, int slow, int signal) {
  MacdResult result;
  if (fast < 1 || slow < 1 || signal < 1) return result;
  if (static_cast<int>(series.size()) < slow + signal) return result;

  IndicatorSeries emaFast = computeEma(series, fast);
  IndicatorSeries emaSlow = computeEma(series, slow);

  IndicatorSeries macdLine;
  for (const auto& j : joinByDate(emaFast, emaSlow)) {
    macdLine.push_back({j.day, *j.left.value - *j.right.value});
  }

  IndicatorSeries signalLine = computeEma(macdLine, signal);
  if (signalLine.empty()) return result;

  IndicatorSeries histogram;
  histogram.reserve(signalLine.size());
  for (const auto& j : joinByDate(macdLine, signalLine)) {
    histogram.push_back({j.day, *j.left.value - *j.right.value});
  }

  result.macdLine = std::move(macdLine);
  result.signalLine = std::move(signalLine);
  result.histogram = std::move(histogram);
  return result;
}

BandSeries computeBollinger(const PriceSeries& series, int period, double devs) {
  BandSeries bands;
  int count = static_cast<int>(series.size());
  if (period < 1 || count < period) return bands;

  std::vector<double> closes;
  closes.reserve(series.size());
  for (const auto& p : series) closes.push_back(p.close);

  // Middle line shares the running-sum SMA so it matches computeSma() exactly.
  auto middle = smaValues(closes.data(), count, period);

  bands.reserve(static_cast<std::size_t>(count - period + 1));
  for (int i = period - 1; i < count; i++) {
    double mean = *middle[static_cast<std::size_t>(i)];
    double sd = populationStdDev(closes.data() + (i - period + 1), period, mean);
    bands.push_back({series[i].day, mean + devs * sd, mean, mean - devs * sd});
  }

  return bands;
}

} // namespace sl
