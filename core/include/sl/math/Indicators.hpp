#pragma once
#include "sl/series/Types.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace sl {

// RSI (Relative Strength Index), Wilder smoothing.
// First point is emitted at index `period` (seeded from the first `period`
// changes); nothing is emitted when count < period + 1.
// A zero average loss yields exactly 100.
IndicatorSeries computeRsi(const PriceSeries& series, int period = 14);

enum class RsiSmoothingType : std::uint8_t {
  Sma,
  Ema,
  SmaWithBands
};

struct RsiPoint {
  DayKey day{0};
  double rsi{0.0};
  std::optional<double> smoothing;
  std::optional<double> upper;   // SmaWithBands only
  std::optional<double> lower;
};

// Smoothing line (and optional ±mult·σ bands) over an RSI series.
// One output point per defined RSI point; smoothing/bands stay absent until
// `lookback` RSI values have accumulated.
std::vector<RsiPoint> computeRsiSmoothing(const IndicatorSeries& rsi,
                                          RsiSmoothingType type,
                                          int lookback, double mult);

// MACD: fast EMA - slow EMA, its signal EMA, and the histogram.
// Returns an empty result (all three series empty) when count < slow + signal.
MacdResult computeMacd(const PriceSeries& series, int fast = 12, int slow = 26,
                       int signal = 9);

// Bollinger Bands: SMA(period) ± devs·σ (population σ of the same window).
BandSeries computeBollinger(const PriceSeries& series, int period = 20,
                            double devs = 2.0);

} // namespace sl
