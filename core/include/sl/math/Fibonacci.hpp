#pragma once
#include "sl/series/Types.hpp"

namespace sl {

// Fibonacci retracement over the whole window of closes.
// Levels run from "100% (Low)" (value == low) to "0% (High)" (value == high);
// intermediate levels are high - (high-low)*ratio.
// valid == false when fewer than two closes are supplied.
FibonacciResult computeFibonacci(const PriceSeries& series);

} // namespace sl
