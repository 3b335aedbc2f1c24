#pragma once

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace stats {

/* sum of a[0..n), accumulated left to right
 */
template <typename T> T sum(const T *a, const size_t n) {
  T ret = 0;
  for (size_t i = 0; i < n; ++i) {
    ret += a[i];
  }
  return ret;
}

template <typename T> T sum_squares(const T *a, const size_t n) {
  T ret = 0;
  for (size_t i = 0; i < n; ++i) {
    ret += a[i] * a[i];
  }
  return ret;
}

/* sum of (a[i] - center)^2, accumulated left to right
 */
template <typename T> T sum_squared_deviations(const T *a, const size_t n, const T center) {
  T ret = 0;
  for (size_t i = 0; i < n; ++i) {
    const T d = a[i] - center;
    ret += d * d;
  }
  return ret;
}

/* largest |a[i] - b[i]|, 0 when n is 0.
   NaN in either input is returned as NaN.
*/
template <typename T> T max_abs_error(const T *a, const T *b, const size_t n) {
  T ret = 0;
  for (size_t i = 0; i < n; ++i) {
    const T err = std::abs(a[i] - b[i]);
    if (std::isnan(err)) {
      return err;
    }
    ret = std::max(ret, err);
  }
  return ret;
}

} // namespace stats
