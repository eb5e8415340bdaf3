#include "sl/session/AnalysisConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace sl {

const char* rsiSmoothingTypeName(RsiSmoothingType t) {
  switch (t) {
    case RsiSmoothingType::Sma:          return "SMA";
    case RsiSmoothingType::Ema:          return "EMA";
    case RsiSmoothingType::SmaWithBands: return "SMA + Bollinger Bands";
  }
  return "SMA";
}

bool parseRsiSmoothingType(const std::string& name, RsiSmoothingType& out) {
  if (name == "SMA") { out = RsiSmoothingType::Sma; return true; }
  if (name == "EMA") { out = RsiSmoothingType::Ema; return true; }
  if (name == "SMA + Bollinger Bands") { out = RsiSmoothingType::SmaWithBands; return true; }
  return false;
}

static rapidjson::Value intArray(const std::vector<int>& values,
                                 rapidjson::Document::AllocatorType& alloc) {
  rapidjson::Value arr(rapidjson::kArrayType);
  for (int v : values) arr.PushBack(v, alloc);
  return arr;
}

std::string serializeAnalysisConfig(const AnalysisConfig& config) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("version",
                rapidjson::Value(config.version.c_str(), alloc), alloc);
  doc.AddMember("minimumPoints", config.minimumPoints, alloc);
  doc.AddMember("smaPeriods", intArray(config.smaPeriods, alloc), alloc);
  doc.AddMember("emaPeriods", intArray(config.emaPeriods, alloc), alloc);

  // RSI
  rapidjson::Value rsi(rapidjson::kObjectType);
  rsi.AddMember("period", config.rsi.period, alloc);
  rsi.AddMember("smoothingType",
                rapidjson::Value(rsiSmoothingTypeName(config.rsi.smoothingType), alloc), alloc);
  rsi.AddMember("smoothingLength", config.rsi.smoothingLength, alloc);
  rsi.AddMember("bandMultiplier", config.rsi.bandMultiplier, alloc);
  rsi.AddMember("oversold", config.rsi.oversold, alloc);
  rsi.AddMember("overbought", config.rsi.overbought, alloc);
  doc.AddMember("rsi", rsi, alloc);

  // Divergence
  rapidjson::Value div(rapidjson::kObjectType);
  div.AddMember("enabled", config.divergence.enabled, alloc);
  div.AddMember("lookbackLeft", config.divergence.lookbackLeft, alloc);
  div.AddMember("lookbackRight", config.divergence.lookbackRight, alloc);
  doc.AddMember("divergence", div, alloc);

  // MACD
  rapidjson::Value macd(rapidjson::kObjectType);
  macd.AddMember("fastPeriod", config.macd.fastPeriod, alloc);
  macd.AddMember("slowPeriod", config.macd.slowPeriod, alloc);
  macd.AddMember("signalPeriod", config.macd.signalPeriod, alloc);
  doc.AddMember("macd", macd, alloc);

  // Bollinger
  rapidjson::Value bb(rapidjson::kObjectType);
  bb.AddMember("period", config.bollinger.period, alloc);
  bb.AddMember("numStdDev", config.bollinger.numStdDev, alloc);
  doc.AddMember("bollinger", bb, alloc);

  // Crossover
  rapidjson::Value cross(rapidjson::kObjectType);
  cross.AddMember("fastPeriod", config.crossover.fastPeriod, alloc);
  cross.AddMember("slowPeriod", config.crossover.slowPeriod, alloc);
  doc.AddMember("crossover", cross, alloc);

  // Display
  rapidjson::Value display(rapidjson::kObjectType);
  display.AddMember("maxPoints", config.display.maxPoints, alloc);
  doc.AddMember("display", display, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

static void readInt(const rapidjson::Value& obj, const char* key, int& out) {
  if (obj.HasMember(key) && obj[key].IsInt()) out = obj[key].GetInt();
}

static void readDouble(const rapidjson::Value& obj, const char* key, double& out) {
  if (obj.HasMember(key) && obj[key].IsNumber()) out = obj[key].GetDouble();
}

static void readBool(const rapidjson::Value& obj, const char* key, bool& out) {
  if (obj.HasMember(key) && obj[key].IsBool()) out = obj[key].GetBool();
}

static void readIntArray(const rapidjson::Value& obj, const char* key, std::vector<int>& out) {
  if (!obj.HasMember(key) || !obj[key].IsArray()) return;
  std::vector<int> values;
  for (const auto& v : obj[key].GetArray()) {
    if (!v.IsInt()) return;
    values.push_back(v.GetInt());
  }
  out = values;
}

static const rapidjson::Value* section(const rapidjson::Value& doc, const char* key) {
  if (doc.HasMember(key) && doc[key].IsObject()) return &doc[key];
  return nullptr;
}

bool deserializeAnalysisConfig(const std::string& json, AnalysisConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  if (doc.HasMember("version") && doc["version"].IsString())
    out.version = doc["version"].GetString();
  readInt(doc, "minimumPoints", out.minimumPoints);
  readIntArray(doc, "smaPeriods", out.smaPeriods);
  readIntArray(doc, "emaPeriods", out.emaPeriods);

  if (const auto* rsi = section(doc, "rsi")) {
    readInt(*rsi, "period", out.rsi.period);
    if (rsi->HasMember("smoothingType") && (*rsi)["smoothingType"].IsString()) {
      parseRsiSmoothingType((*rsi)["smoothingType"].GetString(), out.rsi.smoothingType);
    }
    readInt(*rsi, "smoothingLength", out.rsi.smoothingLength);
    readDouble(*rsi, "bandMultiplier", out.rsi.bandMultiplier);
    readDouble(*rsi, "oversold", out.rsi.oversold);
    readDouble(*rsi, "overbought", out.rsi.overbought);
  }

  if (const auto* div = section(doc, "divergence")) {
    readBool(*div, "enabled", out.divergence.enabled);
    readInt(*div, "lookbackLeft", out.divergence.lookbackLeft);
    readInt(*div, "lookbackRight", out.divergence.lookbackRight);
  }

  if (const auto* macd = section(doc, "macd")) {
    readInt(*macd, "fastPeriod", out.macd.fastPeriod);
    readInt(*macd, "slowPeriod", out.macd.slowPeriod);
    readInt(*macd, "signalPeriod", out.macd.signalPeriod);
  }

  if (const auto* bb = section(doc, "bollinger")) {
    readInt(*bb, "period", out.bollinger.period);
    readDouble(*bb, "numStdDev", out.bollinger.numStdDev);
  }

  if (const auto* cross = section(doc, "crossover")) {
    readInt(*cross, "fastPeriod", out.crossover.fastPeriod);
    readInt(*cross, "slowPeriod", out.crossover.slowPeriod);
  }

  if (const auto* display = section(doc, "display")) {
    readInt(*display, "maxPoints", out.display.maxPoints);
  }

  return true;
}

static bool fail(ConfigError& err, const char* code, const std::string& message) {
  err.code = code;
  err.message = message;
  return false;
}

bool validateAnalysisConfig(const AnalysisConfig& config, ConfigError& err) {
  for (int p : config.smaPeriods) {
    if (p < 1) return fail(err, "INVALID_PERIOD", "SMA period must be >= 1, got " + std::to_string(p));
  }
  for (int p : config.emaPeriods) {
    if (p < 1) return fail(err, "INVALID_PERIOD", "EMA period must be >= 1, got " + std::to_string(p));
  }
  if (config.rsi.period < 1 || config.rsi.smoothingLength < 1)
    return fail(err, "INVALID_PERIOD", "RSI period and smoothing length must be >= 1");
  if (config.rsi.bandMultiplier < 0.0)
    return fail(err, "INVALID_MULTIPLIER", "RSI band multiplier must be >= 0");
  if (config.rsi.oversold >= config.rsi.overbought)
    return fail(err, "INVALID_THRESHOLDS", "RSI oversold level must be below overbought level");
  if (config.divergence.lookbackLeft < 0 || config.divergence.lookbackRight < 0)
    return fail(err, "INVALID_LOOKBACK", "divergence lookbacks must be >= 0");
  if (config.macd.fastPeriod < 1 || config.macd.slowPeriod < 1 || config.macd.signalPeriod < 1)
    return fail(err, "INVALID_PERIOD", "MACD periods must be >= 1");
  if (config.macd.fastPeriod >= config.macd.slowPeriod)
    return fail(err, "INVALID_PERIOD", "MACD fast period must be shorter than slow period");
  if (config.bollinger.period < 1)
    return fail(err, "INVALID_PERIOD", "Bollinger period must be >= 1");
  if (config.bollinger.numStdDev < 0.0)
    return fail(err, "INVALID_MULTIPLIER", "Bollinger deviation count must be >= 0");
  if (config.crossover.fastPeriod < 1 || config.crossover.fastPeriod >= config.crossover.slowPeriod)
    return fail(err, "INVALID_PERIOD", "crossover fast period must be >= 1 and shorter than slow period");
  if (config.display.maxPoints < 0)
    return fail(err, "INVALID_DISPLAY", "display maxPoints must be >= 0");
  return true;
}

} // namespace sl
