#include "sl/data/SyntheticHistory.hpp"

#include <algorithm>

namespace sl {

PriceSeries generateSyntheticHistory(const SyntheticHistoryConfig& config) {
  // RNG: simple LCG
  std::uint32_t seed = config.seed;
  auto rng = [&seed]() -> double {
    seed = seed * 1103515245u + 12345u;
    return static_cast<double>((seed >> 16) & 0x7FFF) / 32767.0;
  };

  PriceSeries series;
  series.reserve(config.days);

  double price = config.startPrice;
  DayKey day = config.startDay;
  while (series.size() < config.days) {
    if (config.skipWeekends && isoWeekday(day) >= 6) {
      ++day;
      continue;
    }

    price += (rng() - 0.5) * config.volatility * 2.0;
    price = std::max(price, 0.01);

    PricePoint p;
    p.day = day;
    p.close = price;
    p.high = price + rng() * config.volatility * 0.5;
    p.low = std::max(price - rng() * config.volatility * 0.5, 0.0);
    p.volume = 1e5 + rng() * 9e5;
    series.push_back(p);
    ++day;
  }
  return series;
}

} // namespace sl
