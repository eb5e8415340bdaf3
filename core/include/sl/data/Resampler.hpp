#pragma once
#include <cstddef>
#include <vector>

namespace sl {

// Indices kept when thinning `count` points to about `maxPoints`:
// every step-th index (step = ceil(count/maxPoints)) plus the last one.
// All indices when count <= maxPoints or maxPoints == 0.
std::vector<std::size_t> resampleIndices(std::size_t count, std::size_t maxPoints);

// Display-size reduction only; never fed back into indicator math.
template <typename T>
std::vector<T> resampleForDisplay(const std::vector<T>& series, std::size_t maxPoints) {
  if (maxPoints == 0 || series.size() <= maxPoints) return series;
  std::vector<T> out;
  for (std::size_t i : resampleIndices(series.size(), maxPoints)) out.push_back(series[i]);
  return out;
}

} // namespace sl
