#pragma once
#include "sl/series/Types.hpp"

#include <vector>

namespace sl {

// Pivot tests over values[0..count). The comparison is deliberately
// asymmetric: a pivot low needs left neighbours >= v and right neighbours
// strictly > v (mirrored for highs). Indices closer than the lookbacks to
// either end are never pivots.
bool isPivotLow(const double* values, int count, int i, int lookbackLeft, int lookbackRight);
bool isPivotHigh(const double* values, int count, int i, int lookbackLeft, int lookbackRight);

// RSI/price divergence. RSI and prices are date-joined; price lows/highs fall
// back to close when absent. Each new RSI pivot is compared with the previous
// pivot of the same polarity only:
//   pivot low:  price lower low  && RSI higher low  -> BullDivergence
//   pivot high: price higher high && RSI lower high -> BearDivergence
// Signals are anchored at the RSI value and emitted in date order.
std::vector<Signal> detectDivergence(const IndicatorSeries& rsi,
                                     const PriceSeries& prices,
                                     int lookbackLeft = 5, int lookbackRight = 5);

} // namespace sl
