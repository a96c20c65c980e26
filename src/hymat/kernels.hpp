#ifndef HYMAT_KERNELS_HPP
#define HYMAT_KERNELS_HPP

#include <omp.h>
#include <algorithm>
#include <cstddef>
#include "coercion.hpp"
#include "library_config.hpp"
#include "storage.hpp"
#include "types.hpp"

namespace hymat::kernels {

// Presents every entry in `source` (the grid's own mode), then coerces it into
// the operation set's mode. Throws unsupported_coercion if an entry has no
// representation there.
template <NumericOps Ops>
DenseStorage<typename Ops::value_type> to_typed(const DenseStorage<Entry>& grid,
                                                NumericMode source) {
  DenseStorage<typename Ops::value_type> out(grid.rows(), grid.cols());
  for (size_t i = 0; i < grid.rows(); ++i) {
    for (size_t j = 0; j < grid.cols(); ++j) {
      const Entry& raw = grid.get(i, j);
      if (mode_of(raw) == source)
        out.get(i, j) = Ops::unwrap(coerce(raw, Ops::mode).value());
      else
        out.get(i, j) = Ops::unwrap(
            coerce(coerce(raw, source).value(), Ops::mode).value());
    }
  }
  return out;
}

template <NumericOps Ops>
DenseStorage<Entry> to_entries(
    const DenseStorage<typename Ops::value_type>& grid) {
  DenseStorage<Entry> out(grid.rows(), grid.cols());
  for (size_t i = 0; i < grid.rows(); ++i)
    for (size_t j = 0; j < grid.cols(); ++j)
      out.get(i, j) = Ops::wrap(grid.get(i, j));
  return out;
}

// ===== Block-Based Multiplication =====
// result(i, j) accumulates a(i, k) * b(k, j) in ascending k; blocking only
// regroups the loops, not the summation order.
template <NumericOps Ops>
DenseStorage<typename Ops::value_type> multiply(
    const DenseStorage<typename Ops::value_type>& a,
    const DenseStorage<typename Ops::value_type>& b) {
  using V = typename Ops::value_type;
  const size_t block_size = BLOCK_SIZE;
  const size_t m = a.rows();
  const size_t inner = a.cols();
  const size_t n = b.cols();

  DenseStorage<V> result(m, n, Ops::zero());

  // One output row; k and j are blocked for cache reuse of b.
  auto row_kernel = [&](size_t i) {
    for (size_t k_outer = 0; k_outer < inner; k_outer += block_size) {
      size_t k_end = std::min(k_outer + block_size, inner);
      for (size_t j_outer = 0; j_outer < n; j_outer += block_size) {
        size_t j_end = std::min(j_outer + block_size, n);
        for (size_t k = k_outer; k < k_end; ++k) {
          const V& aik = a.get(i, k);
          for (size_t j = j_outer; j < j_end; ++j) {
            result.get(i, j) =
                Ops::add(result.get(i, j), Ops::mul(aik, b.get(k, j)));
          }
        }
      }
    }
  };

  if constexpr (HYMAT_OPENMP_ENABLED) {
#pragma omp parallel for num_threads(ThreadCount) if (m >= HYMAT_PARALLEL_MIN_ROWS)
    for (size_t i = 0; i < m; ++i) {
      row_kernel(i);
    }
  } else {
    for (size_t i = 0; i < m; ++i) {
      row_kernel(i);
    }
  }

  return result;
}

}  // namespace hymat::kernels
#endif  // HYMAT_KERNELS_HPP
