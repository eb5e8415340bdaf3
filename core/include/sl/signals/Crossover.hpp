#pragma once
#include "sl/series/Types.hpp"

#include <cstdint>
#include <vector>

namespace sl {

enum class CrossDirection : std::uint8_t { None, Up, Down };

// Strict crossing of a over b between two consecutive observations:
//   Up   iff prevA <= prevB && curA > curB
//   Down iff prevA >= prevB && curA < curB
// A relation that merely persists (or touches without crossing) is None.
CrossDirection strictCross(double prevA, double prevB, double curA, double curB);

struct CrossoverResult {
  std::vector<Signal> signals;  // Golden / Death, anchored at the close
  std::vector<Zone> zones;      // contiguous, ordered by start
};

// Golden/death crosses of `fast` over `slow` (typically SMA(50)/SMA(200)).
// Both MA series are date-joined with `prices`; consecutive joined points are
// compared. The first zone takes its kind from fast > slow at the first
// evaluable bar; every crossing closes the running zone on the crossing day
// and opens the next one there. The last zone ends on the last price day.
CrossoverResult detectGoldenDeathCross(const PriceSeries& prices,
                                       const IndicatorSeries& fast,
                                       const IndicatorSeries& slow);

} // namespace sl
