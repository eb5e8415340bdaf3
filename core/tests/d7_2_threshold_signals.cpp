// D7.2 — RSI / MACD / band signals

#include "sl/signals/ThresholdSignals.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static sl::PriceSeries makePrices(int count) {
  sl::PriceSeries s;
  for (int i = 0; i < count; i++) {
    sl::PricePoint p;
    p.day = i;
    p.close = 100.0 + i;
    s.push_back(p);
  }
  return s;
}

static sl::IndicatorSeries makeLine(const std::vector<double>& values) {
  sl::IndicatorSeries s;
  for (std::size_t i = 0; i < values.size(); i++) {
    s.push_back({static_cast<sl::DayKey>(i), values[i]});
  }
  return s;
}

int main() {
  // ---- Test 1: RSI leaves oversold / overbought ----
  {
    auto signals = sl::detectRsiThresholdSignals(makePrices(5), makeLine({25, 35, 75, 65, 65}));
    requireTrue(signals.size() == 2, "buy + sell");
    requireTrue(signals[0].day == 1 && signals[0].kind == sl::SignalKind::Buy, "buy day 1");
    requireTrue(signals[0].anchorValue == 101.0, "buy anchored at close");
    requireTrue(signals[1].day == 3 && signals[1].kind == sl::SignalKind::Sell, "sell day 3");
    requireTrue(signals[1].anchorValue == 103.0, "sell anchored at close");
    std::printf("  Test 1 (RSI thresholds): PASS\n");
  }

  // ---- Test 2: entering a zone is not a signal ----
  {
    auto signals = sl::detectRsiThresholdSignals(makePrices(4), makeLine({50, 25, 80, 60}),
                                                 30.0, 70.0);
    // 25 -> 80 crosses up through 30 (buy); 80 -> 60 crosses down through 70 (sell)
    requireTrue(signals.size() == 2, "two exits");
    requireTrue(signals[0].day == 2 && signals[1].day == 3, "on the exit bars only");
    std::printf("  Test 2 (zone entry): PASS\n");
  }

  // ---- Test 3: MACD line vs signal ----
  {
    sl::MacdResult macd;
    macd.macdLine = makeLine({-1, 1, 2, -1});
    macd.signalLine = makeLine({0, 0, 0, 0});
    auto signals = sl::detectMacdCrossSignals(makePrices(4), macd);
    requireTrue(signals.size() == 2, "buy + sell");
    requireTrue(signals[0].day == 1 && signals[0].kind == sl::SignalKind::Buy, "buy");
    requireTrue(signals[1].day == 3 && signals[1].kind == sl::SignalKind::Sell, "sell");
    requireTrue(sl::detectMacdCrossSignals(makePrices(4), sl::MacdResult{}).empty(),
                "empty MACD -> no signals");
    std::printf("  Test 3 (MACD): PASS\n");
  }

  // ---- Test 4: band breaches ----
  {
    sl::PriceSeries prices = makePrices(3);
    prices[0].close = 11.0;
    prices[1].close = 7.0;
    prices[2].close = 4.0;
    sl::BandSeries bands = {{0, 10, 7.5, 5}, {1, 10, 7.5, 5}, {2, 10, 7.5, 5}};
    auto breaches = sl::detectBandBreaches(prices, bands);
    requireTrue(breaches.size() == 2, "two breaches");
    requireTrue(breaches[0].day == 0 && breaches[0].kind == sl::BandBreachKind::Overbought,
                "above upper");
    requireTrue(breaches[0].close == 11.0, "carries the close");
    requireTrue(breaches[1].day == 2 && breaches[1].kind == sl::BandBreachKind::Oversold,
                "below lower");
    requireTrue(std::string(sl::bandBreachKindName(breaches[1].kind)) == "oversold", "name");
    std::printf("  Test 4 (bands): PASS\n");
  }

  // ---- Test 5: signal kind names ----
  {
    requireTrue(std::string(sl::signalKindName(sl::SignalKind::Buy)) == "buy", "buy");
    requireTrue(std::string(sl::signalKindName(sl::SignalKind::Death)) == "death", "death");
    requireTrue(std::string(sl::signalKindName(sl::SignalKind::BullDivergence)) ==
                "bull-divergence", "bull-divergence");
    requireTrue(std::string(sl::signalKindName(sl::SignalKind::BearDivergence)) ==
                "bear-divergence", "bear-divergence");
    std::printf("  Test 5 (names): PASS\n");
  }

  std::printf("D7.2 Threshold signals: ALL PASS\n");
  return 0;
}
