#include "sl/data/HistoryParser.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <utility>
#include <vector>

#include <rapidjson/document.h>

namespace sl {

// Epoch dates must land in years 1..9999; anything else is not a trading day.
static bool dayFromEpochNumber(double v, DayKey& out) {
  if (!std::isfinite(v)) return false;
  double seconds = v > 1e12 ? v / 1000.0 : v;
  double days = std::floor(seconds / 86400.0);
  if (days < static_cast<double>(makeDayKey(1, 1, 1)) ||
      days > static_cast<double>(makeDayKey(9999, 12, 31))) {
    return false;
  }
  out = dayKeyFromEpochSeconds(seconds);
  return true;
}

static bool parseRowDate(const rapidjson::Value& v, DayKey& out) {
  if (v.IsNumber()) return dayFromEpochNumber(v.GetDouble(), out);
  if (!v.IsString()) return false;

  std::string s = v.GetString();
  std::size_t b = s.find_first_not_of(" \t");
  std::size_t e = s.find_last_not_of(" \t");
  if (b == std::string::npos) return false;
  s = s.substr(b, e - b + 1);

  bool allDigits = true;
  for (char c : s) {
    if (c < '0' || c > '9') { allDigits = false; break; }
  }
  if (allDigits) return dayFromEpochNumber(std::strtod(s.c_str(), nullptr), out);
  return parseDayKey(s, out);
}

static std::optional<double> optionalNumber(const rapidjson::Value& row, const char* key) {
  auto it = row.FindMember(key);
  if (it == row.MemberEnd() || !it->value.IsNumber()) return std::nullopt;
  return it->value.GetDouble();
}

bool parsePriceHistoryJson(const std::string& json, PriceHistory& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    std::fprintf(stderr, "[HistoryParser] JSON parse error at offset %zu\n",
                 static_cast<std::size_t>(doc.GetErrorOffset()));
    return false;
  }

  const rapidjson::Value* rows = nullptr;
  out.currency.clear();
  if (doc.IsArray()) {
    rows = &doc;
  } else if (doc.IsObject() && doc.HasMember("history") && doc["history"].IsArray()) {
    rows = &doc["history"];
    if (doc.HasMember("currency") && doc["currency"].IsString())
      out.currency = doc["currency"].GetString();
  } else {
    std::fprintf(stderr, "[HistoryParser] expected an array or an object with \"history\"\n");
    return false;
  }

  std::vector<PricePoint> parsed;
  parsed.reserve(rows->Size());
  out.rejectedRows = 0;

  for (const auto& row : rows->GetArray()) {
    if (!row.IsObject()) { out.rejectedRows++; continue; }

    const rapidjson::Value* date = nullptr;
    if (row.HasMember("date")) date = &row["date"];
    else if (row.HasMember("timestamp")) date = &row["timestamp"];

    PricePoint p;
    auto close = optionalNumber(row, "close");
    if (!date || !close || !parseRowDate(*date, p.day)) {
      out.rejectedRows++;
      continue;
    }
    p.close = *close;
    p.high = optionalNumber(row, "high");
    p.low = optionalNumber(row, "low");
    p.volume = optionalNumber(row, "volume");
    parsed.push_back(p);
  }

  if (out.rejectedRows > 0) {
    std::fprintf(stderr, "[HistoryParser] skipped %zu unparseable rows\n", out.rejectedRows);
  }

  out.series = sanitizePriceSeries(std::move(parsed), &out.sanitize);
  return true;
}

} // namespace sl
