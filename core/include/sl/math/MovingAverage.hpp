#pragma once
#include "sl/series/Types.hpp"

namespace sl {

// Simple Moving Average over close prices.
// Output holds one point per index i >= period-1 (all defined); empty when
// the series is shorter than `period` or period < 1.
IndicatorSeries computeSma(const PriceSeries& series, int period);

// Same, over the defined points of a derived series.
IndicatorSeries computeSma(const IndicatorSeries& series, int period);

// Exponential Moving Average.
// output at period-1 = SMA of the first `period` values (seed).
// output at i >= period = value*k + prev*(1-k), k = 2/(period+1).
// Empty on insufficient data, like computeSma.
IndicatorSeries computeEma(const PriceSeries& series, int period);
IndicatorSeries computeEma(const IndicatorSeries& series, int period);

// Building blocks shared by the oscillator overlays: they work on raw value
// arrays and return one entry per input index (absent before period-1).
std::vector<std::optional<double>> smaValues(const double* values, int count, int period);
std::vector<std::optional<double>> emaValues(const double* values, int count, int period);

} // namespace sl
