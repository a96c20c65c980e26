#ifndef HYMAT_ELIMINATION_HPP
#define HYMAT_ELIMINATION_HPP

#include <cstddef>
#include <optional>
#include "library_config.hpp"
#include "matrix_error.hpp"
#include "storage.hpp"
#include "types.hpp"

// Row-reduction algorithms shared by Matrix::determinant, inverse and rank.
// Each takes its working grid by value and never touches the caller's copy.

namespace hymat::elimination {

// First row at or below `from` whose entry in `col` is not zero.
template <NumericOps Ops>
std::optional<size_t> find_pivot(
    const DenseStorage<typename Ops::value_type>& a, size_t from, size_t col,
    double tol = HYMAT_DEFAULT_TOLERANCE) {
  for (size_t r = from; r < a.rows(); ++r) {
    if (!Ops::is_zero(a.get(r, col), tol))
      return r;
  }
  return std::nullopt;
}

// Gaussian elimination with first-nonzero partial pivoting. Division errors
// are not caught: an integer determinant throws non_exact_division as soon as
// a multiplier is fractional.
template <NumericOps Ops>
typename Ops::value_type determinant(
    DenseStorage<typename Ops::value_type> a) {
  using V = typename Ops::value_type;
  const size_t n = a.rows();
  if (n != a.cols())
    throw not_square("determinant only defined for square matrices");

  V det = Ops::one();
  bool negate = false;

  for (size_t i = 0; i < n; ++i) {
    std::optional<size_t> pivot_row = find_pivot<Ops>(a, i, i);
    if (!pivot_row)
      return Ops::zero();

    if (*pivot_row != i) {
      a.swap_rows(i, *pivot_row);
      negate = !negate;
    }

    const V pivot = a.get(i, i);
    det = Ops::mul(det, pivot);

    for (size_t r = i + 1; r < n; ++r) {
      if (Ops::is_zero(a.get(r, i)))
        continue;
      const V mult = Ops::div(a.get(r, i), pivot);
      for (size_t c = i; c < n; ++c) {
        a.get(r, c) = Ops::sub(a.get(r, c), Ops::mul(mult, a.get(i, c)));
      }
    }
  }

  return negate ? Ops::sub(Ops::zero(), det) : det;
}

// Gauss-Jordan elimination on [A | I].
template <NumericOps Ops>
DenseStorage<typename Ops::value_type> inverse(
    const DenseStorage<typename Ops::value_type>& a) {
  using V = typename Ops::value_type;
  if constexpr (Ops::exact) {
    throw unsupported_operation(
        "inverse is not supported for arbitrary-precision integer matrices");
  } else {
    const size_t n = a.rows();
    if (n != a.cols())
      throw not_square("inverse only defined for square matrices");

    const size_t width = 2 * n;
    DenseStorage<V> aug(n, width, Ops::zero());
    for (size_t i = 0; i < n; ++i) {
      for (size_t j = 0; j < n; ++j)
        aug.get(i, j) = a.get(i, j);
      aug.get(i, n + i) = Ops::one();
    }

    for (size_t col = 0; col < n; ++col) {
      std::optional<size_t> pivot_row = find_pivot<Ops>(aug, col, col);
      if (!pivot_row)
        throw singular_matrix();
      aug.swap_rows(col, *pivot_row);

      // Normalize pivot row
      const V pivot = aug.get(col, col);
      for (size_t j = 0; j < width; ++j)
        aug.get(col, j) = Ops::div(aug.get(col, j), pivot);

      // Eliminate other rows
      for (size_t r = 0; r < n; ++r) {
        if (r == col)
          continue;
        const V factor = aug.get(r, col);
        if (Ops::is_zero(factor))
          continue;
        for (size_t j = 0; j < width; ++j) {
          aug.get(r, j) =
              Ops::sub(aug.get(r, j), Ops::mul(factor, aug.get(col, j)));
        }
      }
    }

    DenseStorage<V> result(n, n);
    for (size_t i = 0; i < n; ++i)
      for (size_t j = 0; j < n; ++j)
        result.get(i, j) = aug.get(i, n + j);
    return result;
  }
}

// Row-echelon rank. Real and complex rows are reduced by a single
// scale-and-subtract of the pivot row; integer rows are cross-multiplied
// (pivot * row - lead * pivot_row) so no division ever happens and the count
// stays exact.
template <NumericOps Ops>
size_t rank(DenseStorage<typename Ops::value_type> a,
            double tol = HYMAT_DEFAULT_TOLERANCE) {
  using V = typename Ops::value_type;
  const size_t m = a.rows();
  const size_t n = a.cols();
  size_t rank = 0;
  size_t row = 0;

  for (size_t col = 0; col < n && row < m; ++col) {
    std::optional<size_t> pivot_row = find_pivot<Ops>(a, row, col, tol);
    if (!pivot_row)
      continue;
    a.swap_rows(row, *pivot_row);

    const V pivot = a.get(row, col);
    for (size_t r = row + 1; r < m; ++r) {
      const V lead = a.get(r, col);
      if (Ops::is_zero(lead, tol))
        continue;
      if constexpr (Ops::exact) {
        for (size_t j = col; j < n; ++j) {
          a.get(r, j) = Ops::sub(Ops::mul(pivot, a.get(r, j)),
                                 Ops::mul(lead, a.get(row, j)));
        }
      } else {
        const V mult = Ops::div(lead, pivot);
        for (size_t j = col; j < n; ++j) {
          a.get(r, j) = Ops::sub(a.get(r, j), Ops::mul(mult, a.get(row, j)));
        }
      }
    }

    ++row;
    ++rank;
  }

  return rank;
}

}  // namespace hymat::elimination
#endif  // HYMAT_ELIMINATION_HPP
