#pragma once
#include "sl/math/Fibonacci.hpp"
#include "sl/math/Indicators.hpp"
#include "sl/series/Types.hpp"
#include "sl/session/AnalysisConfig.hpp"
#include "sl/signals/Crossover.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace sl {

struct AnalysisError {
  std::string code;     // e.g. "INSUFFICIENT_HISTORY"
  std::string message;  // human text
};

struct MovingAverageLine {
  std::string name;     // "SMA50", "EMA200", ...
  int period{0};
  IndicatorSeries points;  // empty when the window exceeds the history
};

// Everything one analysis request produces. Every series is keyed by DayKey.
struct AnalysisResult {
  bool ok{true};
  AnalysisError err{};
  std::size_t pointCount{0};

  std::vector<MovingAverageLine> sma;
  std::vector<MovingAverageLine> ema;

  std::vector<RsiPoint> rsi;          // RSI with smoothing overlay
  std::vector<Signal> rsiSignals;     // buy / sell threshold crosses
  std::vector<Signal> divergences;

  MacdResult macd;
  std::vector<Signal> macdSignals;

  BandSeries bollinger;
  std::vector<BandBreach> bandBreaches;

  FibonacciResult fibonacci;
  CrossoverResult goldenDeath;

  std::vector<Peak> peaks;            // weekly, then monthly, then yearly

  // Thinned copies for display only.
  PriceSeries priceResampled;
  std::vector<RsiPoint> rsiResampled;
  IndicatorSeries macdHistogramResampled;
};

// Runs every indicator once over an immutable, sanitized snapshot.
// Fails (ok == false) on an invalid config, unsorted input, or fewer than
// config.minimumPoints points; individual indicators that still lack
// history come back empty.
AnalysisResult analyzePriceSeries(const PriceSeries& series,
                                  const AnalysisConfig& config = AnalysisConfig{});

// JSON with canonical "YYYY-MM-DD" dates and null for absent values.
std::string serializeAnalysisResult(const AnalysisResult& result);

} // namespace sl
