// Analysis demo: load a daily price history (or synthesize one), run every
// indicator once, print the JSON result to stdout.
//
// Usage: sl_analyze_demo [history.json] [config.json]

#include "sl/data/HistoryParser.hpp"
#include "sl/data/SyntheticHistory.hpp"
#include "sl/session/AnalysisConfig.hpp"
#include "sl/session/AnalysisSession.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

static bool readFile(const char* path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

int main(int argc, char** argv) {
  sl::AnalysisConfig config;
  if (argc > 2) {
    std::string json;
    if (!readFile(argv[2], json)) {
      std::fprintf(stderr, "[demo] cannot read config %s\n", argv[2]);
      return 1;
    }
    if (!sl::deserializeAnalysisConfig(json, config)) {
      std::fprintf(stderr, "[demo] malformed config %s\n", argv[2]);
      return 1;
    }
  }

  sl::PriceSeries series;
  if (argc > 1) {
    std::string json;
    if (!readFile(argv[1], json)) {
      std::fprintf(stderr, "[demo] cannot read history %s\n", argv[1]);
      return 1;
    }
    sl::PriceHistory history;
    if (!sl::parsePriceHistoryJson(json, history)) return 1;
    series = std::move(history.series);
    std::fprintf(stderr, "[demo] loaded %zu points (currency: %s)\n", series.size(),
                 history.currency.empty() ? "n/a" : history.currency.c_str());
  } else {
    sl::SyntheticHistoryConfig gen;
    gen.startDay = sl::makeDayKey(2023, 1, 2);
    gen.days = 400;
    series = sl::generateSyntheticHistory(gen);
    std::fprintf(stderr, "[demo] generated %zu synthetic points\n", series.size());
  }

  sl::AnalysisResult result = sl::analyzePriceSeries(series, config);
  std::printf("%s\n", sl::serializeAnalysisResult(result).c_str());

  if (result.ok) {
    std::fprintf(stderr, "[demo] rsi=%zu macd=%zu bands=%zu crosses=%zu divergences=%zu peaks=%zu\n",
                 result.rsi.size(), result.macd.histogram.size(), result.bollinger.size(),
                 result.goldenDeath.signals.size(), result.divergences.size(),
                 result.peaks.size());
  }
  return result.ok ? 0 : 2;
}
