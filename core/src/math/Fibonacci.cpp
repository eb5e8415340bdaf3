#include "sl/math/Fibonacci.hpp"

#include <algorithm>

namespace sl {

namespace {

struct LevelDef {
  const char* label;
  double ratio;
};

constexpr LevelDef kLevels[] = {
  {"100% (Low)", 1.0},
  {"78.6%", 0.786},
  {"61.8%", 0.618},
  {"50%", 0.5},
  {"38.2%", 0.382},
  {"23.6%", 0.236},
  {"0% (High)", 0.0},
};

} // namespace

FibonacciResult computeFibonacci(const PriceSeries& series) {
  FibonacciResult result;
  if (series.size() < 2) return result;

  double high = series.front().close;
  double low = series.front().close;
  for (const auto& p : series) {
    high = std::max(high, p.close);
    low = std::min(low, p.close);
  }
  double diff = high - low;

  result.valid = true;
  result.high = high;
  result.low = low;
  for (const auto& def : kLevels) {
    FibonacciLevel level;
    level.label = def.label;
    level.ratio = def.ratio;
    // End levels carry the extremes verbatim rather than high - diff*ratio.
    if (def.ratio == 1.0) level.value = low;
    else if (def.ratio == 0.0) level.value = high;
    else level.value = high - diff * def.ratio;
    result.levels.push_back(level);
  }
  return result;
}

} // namespace sl
