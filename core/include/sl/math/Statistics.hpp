#pragma once
#include <cmath>

namespace sl {

// Population standard deviation of values[0..count) around a known mean.
inline double populationStdDev(const double* values, int count, double mean) {
  if (count <= 0) return 0.0;
  double varSum = 0.0;
  for (int i = 0; i < count; i++) {
    double d = values[i] - mean;
    varSum += d * d;
  }
  return std::sqrt(varSum / static_cast<double>(count));
}

// Running sum over a fixed-width trailing window. A plain value: callers
// thread it through their loop (acc = acc.advance(...)).
struct WindowSum {
  int width{1};
  int count{0};
  double sum{0.0};

  // `leaving` is the value dropping out of the window; it is only
  // subtracted once the window is already full.
  WindowSum advance(double entering, double leaving) const {
    WindowSum next = *this;
    next.sum += entering;
    if (count >= width) next.sum -= leaving;
    else next.count++;
    return next;
  }

  bool full() const { return count >= width; }
  double mean() const { return sum / static_cast<double>(width); }
};

} // namespace sl
