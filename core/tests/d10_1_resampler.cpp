// D10.1 — Display resampling

#include "sl/data/Resampler.hpp"
#include "sl/series/Types.hpp"

#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: index selection ----
  {
    auto a = sl::resampleIndices(10, 4);
    requireTrue(a == std::vector<std::size_t>({0, 3, 6, 9}), "step 3, last already kept");
    auto b = sl::resampleIndices(11, 4);
    requireTrue(b == std::vector<std::size_t>({0, 3, 6, 9, 10}), "last index appended");
    requireTrue(sl::resampleIndices(4, 4).size() == 4, "count == max -> all");
    requireTrue(sl::resampleIndices(7, 0).size() == 7, "max 0 -> all");
    requireTrue(sl::resampleIndices(0, 4).empty(), "empty");
    std::printf("  Test 1 (indices): PASS\n");
  }

  // ---- Test 2: 400 bars thinned to about 45 ----
  {
    sl::IndicatorSeries s;
    for (int i = 0; i < 400; i++) s.push_back({i, static_cast<double>(i)});
    auto r = sl::resampleForDisplay(s, 45);
    requireTrue(r.size() <= 46, "max + 1 at most");
    requireTrue(r.front().day == 0 && r.back().day == 399, "first and last kept");
    for (std::size_t i = 1; i < r.size(); i++) {
      requireTrue(r[i].day > r[i - 1].day, "order preserved");
    }
    std::printf("  Test 2 (400 -> %zu): PASS\n", r.size());
  }

  // ---- Test 3: short series pass through ----
  {
    sl::PriceSeries s(30);
    for (int i = 0; i < 30; i++) s[i].day = i;
    requireTrue(sl::resampleForDisplay(s, 45).size() == 30, "unchanged");
    std::printf("  Test 3 (pass-through): PASS\n");
  }

  std::printf("D10.1 Resampler: ALL PASS\n");
  return 0;
}
