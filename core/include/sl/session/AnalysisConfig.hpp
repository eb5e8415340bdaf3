#pragma once
#include "sl/math/Indicators.hpp"

#include <string>
#include <vector>

namespace sl {

struct RsiConfig {
  int period{14};
  RsiSmoothingType smoothingType{RsiSmoothingType::SmaWithBands};
  int smoothingLength{14};
  double bandMultiplier{2.0};
  double oversold{30.0};
  double overbought{70.0};
};

struct DivergenceConfig {
  bool enabled{true};
  int lookbackLeft{5};
  int lookbackRight{5};
};

struct MacdConfig {
  int fastPeriod{12};
  int slowPeriod{26};
  int signalPeriod{9};
};

struct BollingerConfig {
  int period{20};
  double numStdDev{2.0};
};

struct CrossoverConfig {
  int fastPeriod{50};
  int slowPeriod{200};
};

struct DisplayConfig {
  int maxPoints{45};
};

// Settings for one analysis request. Defaults reproduce the dashboard.
struct AnalysisConfig {
  std::string version{"1.0"};
  int minimumPoints{35};
  std::vector<int> smaPeriods{10, 50, 100, 200};
  std::vector<int> emaPeriods{50, 100, 200};
  RsiConfig rsi;
  DivergenceConfig divergence;
  MacdConfig macd;
  BollingerConfig bollinger;
  CrossoverConfig crossover;
  DisplayConfig display;
};

struct ConfigError {
  std::string code;     // e.g. "INVALID_PERIOD"
  std::string message;
};

const char* rsiSmoothingTypeName(RsiSmoothingType t);
bool parseRsiSmoothingType(const std::string& name, RsiSmoothingType& out);

// Serialize AnalysisConfig to a JSON string.
std::string serializeAnalysisConfig(const AnalysisConfig& config);

// Overlay members present in `json` onto `out` (start from defaults).
// Wrong-typed members are ignored. Returns false on malformed JSON.
bool deserializeAnalysisConfig(const std::string& json, AnalysisConfig& out);

// Returns false and fills `err` for settings no indicator can honour.
bool validateAnalysisConfig(const AnalysisConfig& config, ConfigError& err);

} // namespace sl
