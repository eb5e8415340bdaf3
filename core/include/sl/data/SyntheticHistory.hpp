#pragma once
#include "sl/series/Types.hpp"

#include <cstddef>
#include <cstdint>

namespace sl {

struct SyntheticHistoryConfig {
  DayKey startDay{0};
  std::size_t days{400};
  double startPrice{100.0};
  double volatility{1.5};
  std::uint32_t seed{42};
  bool skipWeekends{true};
};

// Deterministic random-walk daily bars (same seed -> same series), for demos
// and tests. Close moves by up to ±volatility per bar; high/low straddle it.
PriceSeries generateSyntheticHistory(const SyntheticHistoryConfig& config);

} // namespace sl
