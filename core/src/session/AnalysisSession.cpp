#include "sl/session/AnalysisSession.hpp"
#include "sl/data/PeriodExtrema.hpp"
#include "sl/data/Resampler.hpp"
#include "sl/math/MovingAverage.hpp"
#include "sl/series/TemporalSeries.hpp"
#include "sl/signals/Divergence.hpp"
#include "sl/signals/ThresholdSignals.hpp"

#include <cmath>
#include <cstdio>
#include <initializer_list>
#include <optional>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace sl {

static AnalysisResult failed(const std::string& code, const std::string& message) {
  std::fprintf(stderr, "[AnalysisSession] %s: %s\n", code.c_str(), message.c_str());
  AnalysisResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  return r;
}

AnalysisResult analyzePriceSeries(const PriceSeries& series, const AnalysisConfig& config) {
  ConfigError cfgErr;
  if (!validateAnalysisConfig(config, cfgErr)) return failed(cfgErr.code, cfgErr.message);

  if (!isStrictlyAscending(series))
    return failed("UNSORTED_INPUT", "price series must be strictly ascending by day");

  if (static_cast<int>(series.size()) < config.minimumPoints) {
    return failed("INSUFFICIENT_HISTORY",
                  "need at least " + std::to_string(config.minimumPoints) +
                  " daily points, got " + std::to_string(series.size()));
  }

  AnalysisResult r;
  r.pointCount = series.size();

  for (int p : config.smaPeriods) {
    r.sma.push_back({"SMA" + std::to_string(p), p, computeSma(series, p)});
  }
  for (int p : config.emaPeriods) {
    r.ema.push_back({"EMA" + std::to_string(p), p, computeEma(series, p)});
  }

  // RSI family
  IndicatorSeries rsi = computeRsi(series, config.rsi.period);
  r.rsi = computeRsiSmoothing(rsi, config.rsi.smoothingType,
                              config.rsi.smoothingLength, config.rsi.bandMultiplier);
  r.rsiSignals = detectRsiThresholdSignals(series, rsi, config.rsi.oversold,
                                           config.rsi.overbought);
  if (config.divergence.enabled) {
    r.divergences = detectDivergence(rsi, series, config.divergence.lookbackLeft,
                                     config.divergence.lookbackRight);
  }

  // MACD
  r.macd = computeMacd(series, config.macd.fastPeriod, config.macd.slowPeriod,
                       config.macd.signalPeriod);
  r.macdSignals = detectMacdCrossSignals(series, r.macd);

  // Bands and levels
  r.bollinger = computeBollinger(series, config.bollinger.period, config.bollinger.numStdDev);
  r.bandBreaches = detectBandBreaches(series, r.bollinger);
  r.fibonacci = computeFibonacci(series);

  // Golden / death cross
  r.goldenDeath = detectGoldenDeathCross(series,
                                         computeSma(series, config.crossover.fastPeriod),
                                         computeSma(series, config.crossover.slowPeriod));

  for (PeriodType period : {PeriodType::Week, PeriodType::Month, PeriodType::Year}) {
    auto peaks = aggregatePeriodExtrema(series, period);
    r.peaks.insert(r.peaks.end(), peaks.begin(), peaks.end());
  }

  auto maxPoints = static_cast<std::size_t>(config.display.maxPoints);
  r.priceResampled = resampleForDisplay(series, maxPoints);
  r.rsiResampled = resampleForDisplay(r.rsi, maxPoints);
  r.macdHistogramResampled = resampleForDisplay(r.macd.histogram, maxPoints);

  return r;
}

// ---- Serialization ----

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void writeDay(JsonWriter& w, const char* key, DayKey day) {
  std::string s = formatDayKey(day);
  w.Key(key);
  w.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
}

// Non-finite values (σ overflow on extreme prices) are written as null.
void writeNumber(JsonWriter& w, double v) {
  if (std::isfinite(v)) w.Double(v);
  else w.Null();
}

void writeOptional(JsonWriter& w, const char* key, const std::optional<double>& v) {
  w.Key(key);
  if (v) writeNumber(w, *v);
  else w.Null();
}

void writeIndicatorSeries(JsonWriter& w, const IndicatorSeries& series) {
  w.StartArray();
  for (const auto& p : series) {
    w.StartObject();
    writeDay(w, "date", p.day);
    writeOptional(w, "value", p.value);
    w.EndObject();
  }
  w.EndArray();
}

void writeLines(JsonWriter& w, const std::vector<MovingAverageLine>& lines) {
  w.StartObject();
  for (const auto& line : lines) {
    w.Key(line.name.c_str());
    writeIndicatorSeries(w, line.points);
  }
  w.EndObject();
}

void writeRsiPoints(JsonWriter& w, const std::vector<RsiPoint>& points) {
  w.StartArray();
  for (const auto& p : points) {
    w.StartObject();
    writeDay(w, "date", p.day);
    w.Key("value");          writeNumber(w, p.rsi);
    writeOptional(w, "smoothing", p.smoothing);
    writeOptional(w, "smoothingUpper", p.upper);
    writeOptional(w, "smoothingLower", p.lower);
    w.EndObject();
  }
  w.EndArray();
}

void writeSignals(JsonWriter& w, const std::vector<Signal>& signals) {
  w.StartArray();
  for (const auto& s : signals) {
    w.StartObject();
    writeDay(w, "date", s.day);
    w.Key("type");  w.String(signalKindName(s.kind));
    w.Key("value"); writeNumber(w, s.anchorValue);
    w.EndObject();
  }
  w.EndArray();
}

void writePrices(JsonWriter& w, const PriceSeries& series) {
  w.StartArray();
  for (const auto& p : series) {
    w.StartObject();
    writeDay(w, "date", p.day);
    w.Key("close"); writeNumber(w, p.close);
    writeOptional(w, "high", p.high);
    writeOptional(w, "low", p.low);
    writeOptional(w, "volume", p.volume);
    w.EndObject();
  }
  w.EndArray();
}

} // namespace

std::string serializeAnalysisResult(const AnalysisResult& result) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);

  w.StartObject();
  w.Key("ok"); w.Bool(result.ok);
  if (!result.ok) {
    w.Key("error");
    w.StartObject();
    w.Key("code");    w.String(result.err.code.c_str());
    w.Key("message"); w.String(result.err.message.c_str());
    w.EndObject();
    w.EndObject();
    return sb.GetString();
  }

  w.Key("pointCount"); w.Uint64(result.pointCount);
  w.Key("sma"); writeLines(w, result.sma);
  w.Key("ema"); writeLines(w, result.ema);

  w.Key("rsi");         writeRsiPoints(w, result.rsi);
  w.Key("rsiSignals");  writeSignals(w, result.rsiSignals);
  w.Key("divergences"); writeSignals(w, result.divergences);

  w.Key("macd");
  w.StartObject();
  w.Key("macdLine");   writeIndicatorSeries(w, result.macd.macdLine);
  w.Key("signalLine"); writeIndicatorSeries(w, result.macd.signalLine);
  w.Key("histogram");  writeIndicatorSeries(w, result.macd.histogram);
  w.EndObject();
  w.Key("macdSignals"); writeSignals(w, result.macdSignals);

  w.Key("bollinger");
  w.StartArray();
  for (const auto& b : result.bollinger) {
    w.StartObject();
    writeDay(w, "date", b.day);
    w.Key("upper");  writeNumber(w, b.upper);
    w.Key("middle"); writeNumber(w, b.middle);
    w.Key("lower");  writeNumber(w, b.lower);
    w.EndObject();
  }
  w.EndArray();
  w.Key("bandBreaches");
  w.StartArray();
  for (const auto& b : result.bandBreaches) {
    w.StartObject();
    writeDay(w, "date", b.day);
    w.Key("type");  w.String(bandBreachKindName(b.kind));
    w.Key("value"); writeNumber(w, b.close);
    w.EndObject();
  }
  w.EndArray();

  w.Key("fibonacci");
  if (!result.fibonacci.valid) {
    w.Null();
  } else {
    w.StartObject();
    w.Key("high"); writeNumber(w, result.fibonacci.high);
    w.Key("low");  writeNumber(w, result.fibonacci.low);
    w.Key("levels");
    w.StartArray();
    for (const auto& lv : result.fibonacci.levels) {
      w.StartObject();
      w.Key("level"); w.String(lv.label.c_str());
      w.Key("ratio"); writeNumber(w, lv.ratio);
      w.Key("value"); writeNumber(w, lv.value);
      w.EndObject();
    }
    w.EndArray();
    w.EndObject();
  }

  w.Key("goldenDeathSignals"); writeSignals(w, result.goldenDeath.signals);
  w.Key("goldenDeathZones");
  w.StartArray();
  for (const auto& z : result.goldenDeath.zones) {
    w.StartObject();
    writeDay(w, "start", z.start);
    writeDay(w, "end", z.end);
    w.Key("type"); w.String(zoneKindName(z.kind));
    w.EndObject();
  }
  w.EndArray();

  w.Key("peaks");
  w.StartArray();
  for (const auto& p : result.peaks) {
    w.StartObject();
    writeDay(w, "date", p.day);
    w.Key("type");   w.String(peakKindName(p.kind));
    w.Key("period"); w.String(periodTypeName(p.period));
    w.Key("value");  writeNumber(w, p.value);
    w.EndObject();
  }
  w.EndArray();

  w.Key("priceResampled");         writePrices(w, result.priceResampled);
  w.Key("rsiResampled");           writeRsiPoints(w, result.rsiResampled);
  w.Key("macdHistogramResampled"); writeIndicatorSeries(w, result.macdHistogramResampled);

  w.EndObject();
  return sb.GetString();
}

} // namespace sl
