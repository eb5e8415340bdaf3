#pragma once
#include "sl/series/DayKey.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sl {

// One daily bar as handed over by the history collaborator.
// high/low/volume are optional; close is always present and finite once the
// row has passed sanitizePriceSeries().
struct PricePoint {
  DayKey day{0};
  double close{0.0};
  std::optional<double> high;
  std::optional<double> low;
  std::optional<double> volume;

  double highOrClose() const { return high ? *high : close; }
  double lowOrClose() const  { return low ? *low : close; }
};

using PriceSeries = std::vector<PricePoint>;

// Absent value = not computable for this day (insufficient lookback).
struct IndicatorPoint {
  DayKey day{0};
  std::optional<double> value;
};

using IndicatorSeries = std::vector<IndicatorPoint>;

struct BandPoint {
  DayKey day{0};
  double upper{0.0};
  double middle{0.0};
  double lower{0.0};
};

using BandSeries = std::vector<BandPoint>;

struct MacdResult {
  IndicatorSeries macdLine;
  IndicatorSeries signalLine;
  IndicatorSeries histogram;

  bool empty() const { return macdLine.empty(); }
};

enum class SignalKind : std::uint8_t {
  Buy,
  Sell,
  Golden,
  Death,
  BullDivergence,
  BearDivergence
};

const char* signalKindName(SignalKind k);

struct Signal {
  DayKey day{0};
  SignalKind kind{SignalKind::Buy};
  double anchorValue{0.0};  // price or oscillator value the marker sits at
};

// Close outside the Bollinger envelope.
enum class BandBreachKind : std::uint8_t { Overbought, Oversold };

const char* bandBreachKindName(BandBreachKind k);

struct BandBreach {
  DayKey day{0};
  BandBreachKind kind{BandBreachKind::Overbought};
  double close{0.0};
};

enum class ZoneKind : std::uint8_t { Golden, Death };

const char* zoneKindName(ZoneKind k);

// Closed span [start, end]. Consecutive zones share the crossing day.
struct Zone {
  DayKey start{0};
  DayKey end{0};
  ZoneKind kind{ZoneKind::Golden};
};

struct FibonacciLevel {
  std::string label;
  double ratio{0.0};
  double value{0.0};
};

struct FibonacciResult {
  bool valid{false};
  double high{0.0};
  double low{0.0};
  std::vector<FibonacciLevel> levels;  // "100% (Low)" first, "0% (High)" last
};

enum class PeakKind : std::uint8_t { PeriodHigh, PeriodLow };
enum class PeriodType : std::uint8_t { Week, Month, Year };

const char* peakKindName(PeakKind k);
const char* periodTypeName(PeriodType p);

struct Peak {
  DayKey day{0};
  PeakKind kind{PeakKind::PeriodHigh};
  PeriodType period{PeriodType::Week};
  double value{0.0};
};

} // namespace sl
