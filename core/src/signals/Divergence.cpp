#include "sl/signals/Divergence.hpp"
#include "sl/series/TemporalSeries.hpp"

#include <cstddef>
#include <optional>

namespace sl {

bool isPivotLow(const double* values, int count, int i, int lookbackLeft, int lookbackRight) {
  if (i < lookbackLeft || i >= count - lookbackRight) return false;
  double v = values[i];
  for (int j = 1; j <= lookbackLeft; j++) {
    if (values[i - j] < v) return false;
  }
  for (int j = 1; j <= lookbackRight; j++) {
    if (values[i + j] <= v) return false;
  }
  return true;
}

bool isPivotHigh(const double* values, int count, int i, int lookbackLeft, int lookbackRight) {
  if (i < lookbackLeft || i >= count - lookbackRight) return false;
  double v = values[i];
  for (int j = 1; j <= lookbackLeft; j++) {
    if (values[i - j] > v) return false;
  }
  for (int j = 1; j <= lookbackRight; j++) {
    if (values[i + j] >= v) return false;
  }
  return true;
}

namespace {

struct PivotRef {
  double rsi;
  double price;
};

} // namespace

std::vector<Signal> detectDivergence(const IndicatorSeries& rsi,
                                     const PriceSeries& prices,
                                     int lookbackLeft, int lookbackRight) {
  std::vector<Signal> signals;
  if (lookbackLeft < 0 || lookbackRight < 0) return signals;

  auto joined = joinByDate(rsi, prices);
  int count = static_cast<int>(joined.size());

  std::vector<double> rsiVals, lowVals, highVals;
  rsiVals.reserve(joined.size());
  lowVals.reserve(joined.size());
  highVals.reserve(joined.size());
  for (const auto& j : joined) {
    rsiVals.push_back(*j.left.value);
    lowVals.push_back(j.right.lowOrClose());
    highVals.push_back(j.right.highOrClose());
  }

  std::optional<PivotRef> lastLow;
  std::optional<PivotRef> lastHigh;

  for (int i = lookbackLeft; i < count - lookbackRight; i++) {
    std::size_t idx = static_cast<std::size_t>(i);

    if (isPivotLow(rsiVals.data(), count, i, lookbackLeft, lookbackRight)) {
      if (lastLow && lowVals[idx] < lastLow->price && rsiVals[idx] > lastLow->rsi) {
        signals.push_back({joined[idx].day, SignalKind::BullDivergence, rsiVals[idx]});
      }
      lastLow = PivotRef{rsiVals[idx], lowVals[idx]};
    }

    if (isPivotHigh(rsiVals.data(), count, i, lookbackLeft, lookbackRight)) {
      if (lastHigh && highVals[idx] > lastHigh->price && rsiVals[idx] < lastHigh->rsi) {
        signals.push_back({joined[idx].day, SignalKind::BearDivergence, rsiVals[idx]});
      }
      lastHigh = PivotRef{rsiVals[idx], highVals[idx]};
    }
  }

  return signals;
}

} // namespace sl
