// D3.1 — RSI (Wilder)

#include "sl/math/Indicators.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireClose(double a, double b, double tol, const char* msg) {
  if (std::fabs(a - b) > tol) {
    std::fprintf(stderr, "ASSERT FAIL: %s (%.6f vs %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

static sl::PriceSeries makeSeries(const std::vector<double>& closes) {
  sl::PriceSeries s;
  for (std::size_t i = 0; i < closes.size(); i++) {
    sl::PricePoint p;
    p.day = static_cast<sl::DayKey>(i);
    p.close = closes[i];
    s.push_back(p);
  }
  return s;
}

int main() {
  // ---- Test 1: 15 days rising by exactly 1 ----
  {
    std::vector<double> closes;
    for (int i = 0; i < 15; i++) closes.push_back(100.0 + i);
    auto rsi = sl::computeRsi(makeSeries(closes), 14);
    requireTrue(rsi.size() == 1, "one RSI point from 15 closes");
    requireTrue(rsi[0].day == 14, "first RSI at index period");
    requireTrue(*rsi[0].value == 100.0, "all gains -> 100");
    std::printf("  Test 1 (15 rising): PASS\n");
  }

  // ---- Test 2: long rise stays at 100, long fall at 0 ----
  {
    std::vector<double> up, down;
    for (int i = 0; i < 40; i++) {
      up.push_back(50.0 + i);
      down.push_back(90.0 - i);
    }
    auto rsiUp = sl::computeRsi(makeSeries(up), 14);
    auto rsiDown = sl::computeRsi(makeSeries(down), 14);
    requireTrue(rsiUp.size() == 26, "40 - 14 points");
    for (const auto& p : rsiUp) requireTrue(*p.value == 100.0, "avgLoss stays 0 -> 100");
    for (const auto& p : rsiDown) requireClose(*p.value, 0.0, 1e-12, "no gains -> 0");
    std::printf("  Test 2 (monotonic): PASS\n");
  }

  // ---- Test 3: hand-computed Wilder steps ----
  {
    // changes: +1, -1, +1 ; period 2
    auto rsi = sl::computeRsi(makeSeries({1, 2, 1, 2}), 2);
    requireTrue(rsi.size() == 2, "two points");
    requireClose(*rsi[0].value, 50.0, 1e-12, "seed gain 0.5 / loss 0.5 -> 50");
    // avgGain = (0.5*1 + 1)/2 = 0.75, avgLoss = 0.5*1/2 = 0.25, RS = 3
    requireClose(*rsi[1].value, 75.0, 1e-12, "Wilder step -> 75");
    std::printf("  Test 3 (hand-computed): PASS\n");
  }

  // ---- Test 4: mixed prices stay in range ----
  {
    std::vector<double> closes = {44, 44.34, 44.09, 43.61, 44.33, 44.83, 45.10, 45.42, 45.84,
                                  46.08, 45.89, 46.03, 45.61, 46.28, 46.28, 46.00, 46.03, 46.41,
                                  46.22, 45.64};
    auto rsi = sl::computeRsi(makeSeries(closes), 14);
    requireTrue(rsi.size() == 6, "20 - 14 points");
    for (const auto& p : rsi) {
      requireTrue(p.value && *p.value > 0.0 && *p.value < 100.0, "RSI in (0,100)");
    }
    std::printf("  Test 4 (mixed): PASS (rsi[14]=%.2f)\n", *rsi[0].value);
  }

  // ---- Test 5: insufficient data ----
  {
    requireTrue(sl::computeRsi(makeSeries({1, 2, 3}), 14).empty(), "too few -> empty");
    std::vector<double> closes(14, 10.0);
    requireTrue(sl::computeRsi(makeSeries(closes), 14).empty(), "length == period -> empty");
    requireTrue(sl::computeRsi(makeSeries({1, 2}), 0).empty(), "period 0 -> empty");
    std::printf("  Test 5 (insufficient): PASS\n");
  }

  // ---- Test 6: idempotent ----
  {
    std::vector<double> closes;
    for (int i = 0; i < 60; i++) closes.push_back(100.0 + 5.0 * std::sin(i * 0.7));
    auto s = makeSeries(closes);
    auto a = sl::computeRsi(s, 14);
    auto b = sl::computeRsi(s, 14);
    requireTrue(a.size() == b.size(), "same size");
    for (std::size_t i = 0; i < a.size(); i++) {
      requireTrue(a[i].day == b[i].day && *a[i].value == *b[i].value, "bit-identical");
    }
    std::printf("  Test 6 (idempotent): PASS\n");
  }

  std::printf("D3.1 RSI: ALL PASS\n");
  return 0;
}
