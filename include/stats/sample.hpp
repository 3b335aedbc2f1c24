#pragma once

#include <cstdlib>
#include <vector>

namespace stats {

/* A read-only view of a sequence of doubles.

   Does not own its storage, which must outlive the view.
*/
class Sample {
  const double *data_;
  size_t size_;

public:
  Sample() : data_(nullptr), size_(0) {}
  Sample(const double *data, size_t size) : data_(data), size_(size) {}
  Sample(const std::vector<double> &v) : data_(v.data()), size_(v.size()) {}

  size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return 0 == size_; }

  const double *data() const noexcept { return data_; }
  const double &operator[](size_t i) const noexcept { return data_[i]; }

  const double *begin() const noexcept { return data_; }
  const double *end() const noexcept { return data_ + size_; }
};

} // namespace stats
