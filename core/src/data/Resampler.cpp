#include "sl/data/Resampler.hpp"

namespace sl {

std::vector<std::size_t> resampleIndices(std::size_t count, std::size_t maxPoints) {
  std::vector<std::size_t> idx;
  if (count == 0) return idx;

  if (maxPoints == 0 || count <= maxPoints) {
    idx.reserve(count);
    for (std::size_t i = 0; i < count; ++i) idx.push_back(i);
    return idx;
  }

  std::size_t step = (count + maxPoints - 1) / maxPoints;
  for (std::size_t i = 0; i < count; i += step) idx.push_back(i);
  if (idx.back() != count - 1) idx.push_back(count - 1);
  return idx;
}

} // namespace sl
