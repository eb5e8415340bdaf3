#include "sl/series/Types.hpp"

namespace sl {

const char* signalKindName(SignalKind k) {
  switch (k) {
    case SignalKind::Buy:            return "buy";
    case SignalKind::Sell:           return "sell";
    case SignalKind::Golden:         return "golden";
    case SignalKind::Death:          return "death";
    case SignalKind::BullDivergence: return "bull-divergence";
    case SignalKind::BearDivergence: return "bear-divergence";
  }
  return "unknown";
}

const char* bandBreachKindName(BandBreachKind k) {
  return k == BandBreachKind::Overbought ? "overbought" : "oversold";
}

const char* zoneKindName(ZoneKind k) {
  return k == ZoneKind::Golden ? "golden" : "death";
}

const char* peakKindName(PeakKind k) {
  return k == PeakKind::PeriodHigh ? "periodHigh" : "periodLow";
}

const char* periodTypeName(PeriodType p) {
  switch (p) {
    case PeriodType::Week:  return "week";
    case PeriodType::Month: return "month";
    case PeriodType::Year:  return "year";
  }
  return "unknown";
}

} // namespace sl
