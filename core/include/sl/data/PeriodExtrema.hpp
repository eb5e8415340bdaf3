#pragma once
#include "sl/series/Types.hpp"

#include <cstdint>
#include <vector>

namespace sl {

// Bucket key for a day: ISO year*100+week, year*100+month, or year.
std::int32_t periodBucketKey(DayKey day, PeriodType period);

// One PeriodHigh and one PeriodLow peak per bucket, in bucket order.
// The high uses `high` (close when absent), the low uses `low` (close when
// absent); each peak carries the winning bar's own day. Ties keep the
// earliest bar. Input must be day-sorted.
std::vector<Peak> aggregatePeriodExtrema(const PriceSeries& series, PeriodType period);

} // namespace sl
