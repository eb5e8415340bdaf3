#pragma once
#include "sl/data/SeriesSanitizer.hpp"
#include "sl/series/Types.hpp"

#include <cstddef>
#include <string>

namespace sl {

struct PriceHistory {
  PriceSeries series;          // sanitized, ascending, one row per day
  std::string currency;        // empty when the payload carries none
  std::size_t rejectedRows{0}; // unparseable date or non-numeric close
  SanitizeReport sanitize;
};

// Accepts a JSON array of rows, or {"history": [...], "currency": "..."}.
// Row: {"date"|"timestamp": "YYYY-MM-DD[T...]" | digits | epoch number,
//       "close": number, "high"?: number, "low"?: number, "volume"?: number}
// Numeric dates above 1e12 are epoch milliseconds, otherwise seconds.
// Bad rows are skipped; returns false only for a malformed document.
bool parsePriceHistoryJson(const std::string& json, PriceHistory& out);

} // namespace sl
