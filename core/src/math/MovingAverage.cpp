#include "sl/math/MovingAverage.hpp"
#include "sl/math/Statistics.hpp"

#include <cstddef>

namespace sl {

std::vector<std::optional<double>> smaValues(const double* values, int count, int period) {
  std::vector<std::optional<double>> out(static_cast<std::size_t>(count > 0 ? count : 0));
  if (period < 1 || count < period) return out;

  WindowSum acc;
  acc.width = period;
  for (int i = 0; i < count; i++) {
    double leaving = (i >= period) ? values[i - period] : 0.0;
    acc = acc.advance(values[i], leaving);
    if (acc.full()) out[static_cast<std::size_t>(i)] = acc.mean();
  }
  return out;
}

std::vector<std::optional<double>> emaValues(const double* values, int count, int period) {
  std::vector<std::optional<double>> out(static_cast<std::size_t>(count > 0 ? count : 0));
  if (period < 1 || count < period) return out;

  // SMA for the seed value
  double sum = 0.0;
  for (int i = 0; i < period; i++) sum += values[i];
  double ema = sum / static_cast<double>(period);
  out[static_cast<std::size_t>(period - 1)] = ema;

  // EMA for remaining values
  double k = 2.0 / (static_cast<double>(period) + 1.0);
  for (int i = period; i < count; i++) {
    ema = values[i] * k + ema * (1.0 - k);
    out[static_cast<std::size_t>(i)] = ema;
  }
  return out;
}

static IndicatorSeries collect(const std::vector<DayKey>& days,
                               const std::vector<std::optional<double>>& values) {
  IndicatorSeries out;
  for (std::size_t i = 0; i < values.size(); i++) {
    if (values[i]) out.push_back({days[i], values[i]});
  }
  return out;
}

static void split(const PriceSeries& series, std::vector<DayKey>& days,
                  std::vector<double>& values) {
  days.reserve(series.size());
  values.reserve(series.size());
  for (const auto& p : series) {
    days.push_back(p.day);
    values.push_back(p.close);
  }
}

static void split(const IndicatorSeries& series, std::vector<DayKey>& days,
                  std::vector<double>& values) {
  days.reserve(series.size());
  values.reserve(series.size());
  for (const auto& p : series) {
    if (!p.value) continue;
    days.push_back(p.day);
    values.push_back(*p.value);
  }
}

IndicatorSeries computeSma(const PriceSeries& series, int period) {
  std::vector<DayKey> days;
  std::vector<double> values;
  split(series, days, values);
  return collect(days, smaValues(values.data(), static_cast<int>(values.size()), period));
}

IndicatorSeries computeSma(const IndicatorSeries& series, int period) {
  std::vector<DayKey> days;
  std::vector<double> values;
  split(series, days, values);
  return collect(days, smaValues(values.data(), static_cast<int>(values.size()), period));
}

IndicatorSeries computeEma(const PriceSeries& series, int period) {
  std::vector<DayKey> days;
  std::vector<double> values;
  split(series, days, values);
  return collect(days, emaValues(values.data(), static_cast<int>(values.size()), period));
}

IndicatorSeries computeEma(const IndicatorSeries& series, int period) {
  std::vector<DayKey> days;
  std::vector<double> values;
  split(series, days, values);
  return collect(days, emaValues(values.data(), static_cast<int>(values.size()), period));
}

} // namespace sl
