#pragma once
#include "sl/series/Types.hpp"

#include <vector>

namespace sl {

// Buy when RSI crosses up through `oversold`, sell when it crosses down
// through `overbought` (strict crossing, see strictCross). Anchored at close.
std::vector<Signal> detectRsiThresholdSignals(const PriceSeries& prices,
                                              const IndicatorSeries& rsi,
                                              double oversold = 30.0,
                                              double overbought = 70.0);

// Buy when the MACD line crosses above its signal line, sell when it crosses
// below. Anchored at close.
std::vector<Signal> detectMacdCrossSignals(const PriceSeries& prices,
                                           const MacdResult& macd);

// Overbought when close > upper band, oversold when close < lower band.
std::vector<BandBreach> detectBandBreaches(const PriceSeries& prices,
                                           const BandSeries& bands);

} // namespace sl
