#include "sl/data/SeriesSanitizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace sl {

static void clearIfNonFinite(std::optional<double>& v) {
  if (v && !std::isfinite(*v)) v.reset();
}

PriceSeries sanitizePriceSeries(std::vector<PricePoint> rows, SanitizeReport* report) {
  SanitizeReport rep;

  PriceSeries kept;
  kept.reserve(rows.size());
  for (auto& row : rows) {
    if (!std::isfinite(row.close)) {
      rep.droppedRows++;
      continue;
    }
    clearIfNonFinite(row.high);
    clearIfNonFinite(row.low);
    clearIfNonFinite(row.volume);
    kept.push_back(row);
  }

  for (std::size_t i = 1; i < kept.size(); ++i) {
    if (kept[i].day < kept[i - 1].day) { rep.reordered = true; break; }
  }
  if (rep.reordered) {
    std::stable_sort(kept.begin(), kept.end(),
                     [](const PricePoint& a, const PricePoint& b) { return a.day < b.day; });
  }

  PriceSeries out;
  out.reserve(kept.size());
  for (const auto& row : kept) {
    if (!out.empty() && out.back().day == row.day) {
      out.back() = row;
      rep.duplicateDays++;
    } else {
      out.push_back(row);
    }
  }

  if (rep.droppedRows > 0 || rep.duplicateDays > 0) {
    std::fprintf(stderr, "[SeriesSanitizer] dropped %zu non-finite rows, merged %zu duplicate days\n",
                 rep.droppedRows, rep.duplicateDays);
  }

  if (report) *report = rep;
  return out;
}

} // namespace sl
