// D4.1 — MACD

#include "sl/math/Indicators.hpp"
#include "sl/series/TemporalSeries.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireClose(double a, double b, double tol, const char* msg) {
  if (std::fabs(a - b) > tol) {
    std::fprintf(stderr, "ASSERT FAIL: %s (%.10f vs %.10f)\n", msg, a, b);
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
  // ---- Test 1: sizes and alignment on 50 bars ----
  {
    std::vector<double> closes;
    for (int i = 0; i < 50; i++) closes.push_back(100.0 + 3.0 * std::sin(i * 0.3) + i * 0.1);
    auto macd = sl::computeMacd(makeSeries(closes), 12, 26, 9);
    requireTrue(macd.macdLine.size() == 25, "macd line from slow-1");
    requireTrue(macd.macdLine.front().day == 25, "macd starts at index 25");
    requireTrue(macd.signalLine.size() == 17, "signal = EMA(9) over 25 values");
    requireTrue(macd.signalLine.front().day == 33, "signal starts 8 bars later");
    requireTrue(macd.histogram.size() == macd.signalLine.size(), "histogram where signal defined");

    for (const auto& j : sl::joinByDate(sl::joinByDate(macd.macdLine, macd.signalLine),
                                        macd.histogram)) {
      double diff = *j.left.left.value - *j.left.right.value;
      requireTrue(*j.right.value == diff, "histogram == macd - signal exactly");
    }
    std::printf("  Test 1 (alignment): PASS\n");
  }

  // ---- Test 2: linear trend gives a constant MACD ----
  {
    // EMA of a straight line lags it by (period-1)/2, so MACD = 12.5 - 5.5 = 7
    std::vector<double> closes;
    for (int i = 0; i < 80; i++) closes.push_back(static_cast<double>(i));
    auto macd = sl::computeMacd(makeSeries(closes), 12, 26, 9);
    for (const auto& p : macd.macdLine) requireClose(*p.value, 7.0, 1e-9, "MACD of a line");
    for (const auto& p : macd.signalLine) requireClose(*p.value, 7.0, 1e-9, "signal of a line");
    for (const auto& p : macd.histogram) requireClose(*p.value, 0.0, 1e-9, "flat histogram");
    std::printf("  Test 2 (linear): PASS\n");
  }

  // ---- Test 3: constant prices ----
  {
    std::vector<double> closes(40, 55.0);
    auto macd = sl::computeMacd(makeSeries(closes));
    requireTrue(!macd.empty(), "40 >= 35");
    for (const auto& p : macd.histogram) requireClose(*p.value, 0.0, 1e-12, "zero histogram");
    std::printf("  Test 3 (constant): PASS\n");
  }

  // ---- Test 4: insufficient history ----
  {
    std::vector<double> closes(34, 1.0);
    auto macd = sl::computeMacd(makeSeries(closes));
    requireTrue(macd.empty() && macd.signalLine.empty() && macd.histogram.empty(),
                "34 < slow + signal -> empty");
    closes.push_back(1.0);
    requireTrue(sl::computeMacd(makeSeries(closes)).histogram.size() == 2, "35 bars -> 2 points");
    std::printf("  Test 4 (insufficient): PASS\n");
  }

  std::printf("D4.1 MACD: ALL PASS\n");
  return 0;
}
