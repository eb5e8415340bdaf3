// D5.1 — Bollinger Bands

#include "sl/math/Indicators.hpp"
#include "sl/math/MovingAverage.hpp"

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
  // ---- Test 1: hand-computed window ----
  {
    // window {2,4,4,4,5,5,7,9}: mean 5, population sigma 2
    auto bands = sl::computeBollinger(makeSeries({2, 4, 4, 4, 5, 5, 7, 9}), 8, 2.0);
    requireTrue(bands.size() == 1, "single full window");
    requireTrue(bands[0].day == 7, "band at last index");
    requireClose(bands[0].middle, 5.0, 1e-12, "middle");
    requireClose(bands[0].upper, 9.0, 1e-12, "upper = 5 + 2*2");
    requireClose(bands[0].lower, 1.0, 1e-12, "lower = 5 - 2*2");
    std::printf("  Test 1 (hand-computed): PASS\n");
  }

  // ---- Test 2: middle equals SMA, width equals 2*devs*sigma ----
  {
    std::vector<double> closes;
    for (int i = 0; i < 60; i++) closes.push_back(50.0 + 4.0 * std::cos(i * 0.45));
    auto series = makeSeries(closes);
    auto bands = sl::computeBollinger(series, 20, 2.5);
    auto sma = sl::computeSma(series, 20);
    requireTrue(bands.size() == 41 && sma.size() == 41, "one band per SMA point");
    for (std::size_t i = 0; i < bands.size(); i++) {
      requireTrue(bands[i].day == sma[i].day, "same days");
      requireTrue(bands[i].middle == *sma[i].value, "middle is the SMA exactly");
      requireTrue(bands[i].upper >= bands[i].middle && bands[i].lower <= bands[i].middle,
                  "bands straddle middle");
      requireClose(bands[i].upper - bands[i].middle, bands[i].middle - bands[i].lower, 1e-9,
                   "symmetric");
    }
    std::printf("  Test 2 (SMA middle): PASS\n");
  }

  // ---- Test 3: flat window collapses the bands ----
  {
    std::vector<double> closes(25, 12.0);
    auto bands = sl::computeBollinger(makeSeries(closes));
    requireTrue(bands.size() == 6, "25 - 20 + 1");
    for (const auto& b : bands) requireTrue(b.upper == 12.0 && b.lower == 12.0, "sigma 0");
    std::printf("  Test 3 (flat): PASS\n");
  }

  // ---- Test 4: too short ----
  {
    std::vector<double> closes(19, 1.0);
    requireTrue(sl::computeBollinger(makeSeries(closes)).empty(), "19 < 20 -> empty");
    std::printf("  Test 4 (short): PASS\n");
  }

  std::printf("D5.1 Bollinger: ALL PASS\n");
  return 0;
}
