#pragma once
#include "sl/series/Types.hpp"

#include <cstddef>
#include <vector>

namespace sl {

struct SanitizeReport {
  std::size_t droppedRows{0};     // non-finite close
  std::size_t duplicateDays{0};   // earlier rows replaced by a later row for the same day
  bool reordered{false};          // input was not ascending
};

// Makes a row batch safe for the engine: drops rows with a non-finite close,
// clears non-finite high/low/volume, stable-sorts by day and keeps the last
// row of any duplicated day.
PriceSeries sanitizePriceSeries(std::vector<PricePoint> rows,
                                SanitizeReport* report = nullptr);

} // namespace sl
