#include "stats/stats.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <vector>

#include "stats/logging.hpp"
#include "stats/numeric.hpp"

namespace stats {

std::optional<double> mean(Sample sample) {
  if (sample.empty()) {
    return 0.0;
  }
  return sum(sample.data(), sample.size()) / double(sample.size());
}

std::optional<double> stddev(Sample sample) {
  if (sample.empty()) {
    return std::nullopt;
  }

  const double m = *mean(sample);
  const double ssd = sum_squared_deviations(sample.data(), sample.size(), m);
  // n == 1 divides by zero
  LOG_SPEW("stddev: n=" << sample.size() << " mean=" << m << " ssd=" << ssd << " / " << sample.size() - 1);
  const double variance = ssd / double(sample.size() - 1);
  return std::sqrt(variance);
}

std::optional<double> median(Sample sample) {
  if (sample.empty()) {
    return std::nullopt;
  }

  std::vector<double> sorted(sample.begin(), sample.end());
#ifndef NDEBUG
  for (const double x : sorted) {
    assert(!std::isnan(x) && "median is undefined for NaN");
  }
#endif
  std::sort(sorted.begin(), sorted.end());

  const size_t n = sorted.size();
  if (n % 2 == 0) {
    // two middle values, keep the one closer to the beginning
    LOG_SPEW("median: n=" << n << " candidates " << sorted[n / 2 - 1] << ", " << sorted[n / 2]);
    return sorted[n / 2 - 1];
  } else {
    return sorted[n / 2];
  }
}

std::optional<double> l2(Sample sample) { return std::sqrt(sum_squares(sample.data(), sample.size())); }

std::optional<double> mean(std::initializer_list<double> values) { return mean(Sample(values.begin(), values.size())); }
std::optional<double> stddev(std::initializer_list<double> values) {
  return stddev(Sample(values.begin(), values.size()));
}
std::optional<double> median(std::initializer_list<double> values) {
  return median(Sample(values.begin(), values.size()));
}
std::optional<double> l2(std::initializer_list<double> values) { return l2(Sample(values.begin(), values.size())); }

} // namespace stats
