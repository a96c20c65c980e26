#ifndef HYMAT_STORAGE_HPP
#define HYMAT_STORAGE_HPP

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace hymat {

// ==================== Storage ====================
// Contiguous row-major grid. Used both for the Entry grid a Matrix owns and
// for the typed working copies the algorithms operate on.
template <typename T>
class DenseStorage {
 private:
  std::vector<T> data_;
  size_t rows_;
  size_t cols_;

 public:
  DenseStorage() : rows_(0), cols_(0) {}

  DenseStorage(size_t rows, size_t cols, const T& init_val = T{})
      : data_(rows * cols, init_val), rows_(rows), cols_(cols) {}

  DenseStorage(const DenseStorage&) = default;
  DenseStorage& operator=(const DenseStorage&) = default;

  // A moved-from grid is empty, extents included.
  DenseStorage(DenseStorage&& other) noexcept
      : data_(std::move(other.data_)),
        rows_(std::exchange(other.rows_, 0)),
        cols_(std::exchange(other.cols_, 0)) {}

  DenseStorage& operator=(DenseStorage&& other) noexcept {
    if (this != &other) {
      data_ = std::move(other.data_);
      rows_ = std::exchange(other.rows_, 0);
      cols_ = std::exchange(other.cols_, 0);
      other.data_.clear();
    }
    return *this;
  }

  // Largest element count a grid can hold.
  static size_t max_elements() noexcept { return std::vector<T>().max_size(); }

  T& get(size_t row, size_t col) { return data_[row * cols_ + col]; }

  const T& get(size_t row, size_t col) const {
    return data_[row * cols_ + col];
  }

  size_t rows() const noexcept { return rows_; }
  size_t cols() const noexcept { return cols_; }

  void swap_rows(size_t a, size_t b) {
    if (a == b)
      return;
    std::swap_ranges(data_.begin() + a * cols_, data_.begin() + (a + 1) * cols_,
                     data_.begin() + b * cols_);
  }

  typename std::vector<T>::const_iterator begin() const {
    return data_.begin();
  }
  typename std::vector<T>::const_iterator end() const { return data_.end(); }
};

}  // namespace hymat
#endif  // HYMAT_STORAGE_HPP
