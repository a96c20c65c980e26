#ifndef HYMAT_MATRIX_HPP
#define HYMAT_MATRIX_HPP

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "coercion.hpp"
#include "elimination.hpp"
#include "kernels.hpp"
#include "library_config.hpp"
#include "matrix_error.hpp"
#include "numeric_ops.hpp"
#include "storage.hpp"
#include "types.hpp"

namespace hymat {

// Structural classes, listed in the order classify() tests them.
enum class MatrixType {
  Zero,
  Identity,
  Diagonal,
  Scalar,
  Hermitian,
  Symmetric,
  UpperTriangular,
  LowerTriangular,
  Row,
  Column,
  Square,
  Rectangular
};

inline std::string to_string(MatrixType type) {
  switch (type) {
    case MatrixType::Zero:
      return "Zero Matrix";
    case MatrixType::Identity:
      return "Identity Matrix";
    case MatrixType::Diagonal:
      return "Diagonal Matrix";
    case MatrixType::Scalar:
      return "Scalar Matrix";
    case MatrixType::Hermitian:
      return "Hermitian Matrix";
    case MatrixType::Symmetric:
      return "Symmetric Matrix";
    case MatrixType::UpperTriangular:
      return "Upper Triangular Matrix";
    case MatrixType::LowerTriangular:
      return "Lower Triangular Matrix";
    case MatrixType::Row:
      return "Row Matrix";
    case MatrixType::Column:
      return "Column Matrix";
    case MatrixType::Square:
      return "Square Matrix";
    case MatrixType::Rectangular:
      break;
  }
  return "Rectangular Matrix (General)";
}

// ==================== Matrix Class ====================
// Dense grid of Real, Integer or Complex entries. The numeric mode is derived
// from the entries on first use and cached until the next set(). Entries are
// always presented in that mode: in integer mode a stored Real reads back
// truncated toward zero.
//
// Const members never write to the grid, so they may run concurrently on an
// instance nobody is calling set() on.
class Matrix {
 private:
  static constexpr int kUnresolved = -1;

  DenseStorage<Entry> storage_;
  mutable std::atomic<int> mode_cache_;

  Matrix(DenseStorage<Entry> storage, NumericMode mode)
      : storage_(std::move(storage)), mode_cache_(static_cast<int>(mode)) {}

  // Returns rows once the shape is known to fit in one grid.
  static size_t check_dimensions(size_t rows, size_t cols) {
    if (rows == 0 || cols == 0)
      throw invalid_dimensions();
    if (rows > DenseStorage<Entry>::max_elements() / cols)
      throw invalid_dimensions(
          fmt::format("{} x {} exceeds the largest allocatable matrix", rows,
                      cols));
    return rows;
  }

  // A non-finite Real has no integer value, so it may not share a grid with
  // Integer entries unless a Complex entry keeps the matrix in complex mode.
  void check_integer_representable() const {
    bool has_integer = false;
    bool has_non_finite = false;
    for (const Entry& e : storage_) {
      if (std::holds_alternative<Complex>(e))
        return;
      if (std::holds_alternative<Integer>(e))
        has_integer = true;
      else if (!std::isfinite(std::get<Real>(e)))
        has_non_finite = true;
    }
    if (has_integer && has_non_finite)
      throw unsupported_coercion(
          "non-finite real entry in an integer-mode matrix");
  }

  template <typename T>
  void assign_rows(std::initializer_list<std::initializer_list<T>> init) {
    if (init.size() == 0)
      throw invalid_dimensions("input must be a non-empty 2D array");
    const size_t rows = init.size();
    const size_t cols = init.begin()->size();
    check_dimensions(rows, cols);

    storage_ = DenseStorage<Entry>(rows, cols);
    size_t i = 0;
    for (const auto& row : init) {
      if (row.size() != cols)
        throw shape_mismatch();
      size_t j = 0;
      for (const auto& val : row) {
        storage_.get(i, j) = Entry{val};
        ++j;
      }
      ++i;
    }
    check_integer_representable();
  }

  void check_index(size_t row, size_t col) const {
    if (row >= rows() || col >= cols())
      throw index_out_of_range(
          fmt::format("index ({}, {}) is outside the {} matrix", row, col,
                      dimension()));
  }

  template <NumericOps Ops>
  static Matrix from_typed(const DenseStorage<typename Ops::value_type>& grid) {
    return Matrix(kernels::to_entries<Ops>(grid), Ops::mode);
  }

  template <NumericOps Ops>
  DenseStorage<typename Ops::value_type> typed() const {
    return kernels::to_typed<Ops>(storage_, mode());
  }

  // Calls fn(ops, grid) with this matrix's operation set and a typed copy of
  // its entries.
  template <typename Fn>
  auto visit_typed(Fn&& fn) const {
    return with_ops(mode(), [&](auto ops) {
      using Ops = decltype(ops);
      return fn(ops, typed<Ops>());
    });
  }

 public:
  // ===== Constructors =====

  Matrix(size_t rows, size_t cols, const Entry& fill = Entry{Real{0}})
      : storage_(check_dimensions(rows, cols), cols, fill),
        mode_cache_(kUnresolved) {}

  // Plain integral fill values are Real.
  template <std::integral I>
  Matrix(size_t rows, size_t cols, I fill)
      : Matrix(rows, cols, Entry{static_cast<Real>(fill)}) {}

  Matrix(std::initializer_list<std::initializer_list<Entry>> init)
      : mode_cache_(kUnresolved) {
    assign_rows(init);
  }

  // Numeric literals are Real: Matrix{{1, 2}, {3, 4}}
  Matrix(std::initializer_list<std::initializer_list<Real>> init)
      : mode_cache_(kUnresolved) {
    assign_rows(init);
  }

  static Matrix from_array(const std::vector<std::vector<Entry>>& grid) {
    if (grid.empty() || grid.front().empty())
      throw invalid_dimensions("input must be a non-empty 2D array");
    const size_t cols = grid.front().size();

    Matrix result(grid.size(), cols);
    for (size_t i = 0; i < grid.size(); ++i) {
      if (grid[i].size() != cols)
        throw shape_mismatch();
      for (size_t j = 0; j < cols; ++j)
        result.storage_.get(i, j) = grid[i][j];
    }
    result.check_integer_representable();
    return result;
  }

  static Matrix identity(size_t n, NumericMode mode = NumericMode::Real) {
    check_dimensions(n, n);
    return with_ops(mode, [n](auto ops) {
      using Ops = decltype(ops);
      DenseStorage<typename Ops::value_type> grid(n, n, Ops::zero());
      for (size_t i = 0; i < n; ++i)
        grid.get(i, i) = Ops::one();
      return from_typed<Ops>(grid);
    });
  }

  Matrix(const Matrix& other)
      : storage_(other.storage_), mode_cache_(other.mode_cache_.load()) {}

  Matrix(Matrix&& other) noexcept
      : storage_(std::move(other.storage_)),
        mode_cache_(other.mode_cache_.load()) {}

  Matrix& operator=(const Matrix& other) {
    if (this != &other) {
      storage_ = other.storage_;
      mode_cache_.store(other.mode_cache_.load());
    }
    return *this;
  }

  Matrix& operator=(Matrix&& other) noexcept {
    if (this != &other) {
      storage_ = std::move(other.storage_);
      mode_cache_.store(other.mode_cache_.load());
    }
    return *this;
  }

  Matrix clone() const { return Matrix(*this); }

  // ===== Conversion Functions =====

  // Entries come back as stored, except that an integer-mode matrix returns
  // its Real entries truncated to Integer.
  std::vector<std::vector<Entry>> to_array() const {
    const bool integer_mode = mode() == NumericMode::ArbitraryInteger;
    std::vector<std::vector<Entry>> result(rows());
    for (size_t i = 0; i < rows(); ++i) {
      result[i].reserve(cols());
      for (size_t j = 0; j < cols(); ++j) {
        const Entry& raw = storage_.get(i, j);
        result[i].push_back(
            integer_mode ? coerce(raw, NumericMode::ArbitraryInteger).value()
                         : raw);
      }
    }
    return result;
  }

  // ===== Size Information =====

  size_t rows() const noexcept { return storage_.rows(); }
  size_t cols() const noexcept { return storage_.cols(); }

  std::string dimension() const {
    return fmt::format("{} x {}", rows(), cols());
  }

  // ===== Numeric Mode =====

  NumericMode mode() const {
    const int cached = mode_cache_.load();
    if (cached != kUnresolved)
      return static_cast<NumericMode>(cached);

    const NumericMode detected = detect_mode(storage_.begin(), storage_.end());
    if (detected == NumericMode::ArbitraryInteger &&
        std::any_of(storage_.begin(), storage_.end(),
                    truncates_in_integer_mode)) {
      spdlog::warn(
          "[Matrix] {} matrix resolved to integer mode; fractional real "
          "entries are truncated toward zero",
          dimension());
    }
    spdlog::debug("[Matrix] resolved {} mode for {} matrix",
                  to_string(detected), dimension());

    mode_cache_.store(static_cast<int>(detected));
    return detected;
  }

  // ===== Element Access =====

  Entry get(size_t row, size_t col) const {
    check_index(row, col);
    return coerce(storage_.get(row, col), mode()).value();
  }

  // A new entry can change the dominant mode, so the cached mode is dropped.
  // Throws unsupported_coercion, leaving the matrix unchanged, if the entry
  // would put a non-finite Real into an integer-mode matrix.
  void set(size_t row, size_t col, Entry value) {
    check_index(row, col);
    Entry& slot = storage_.get(row, col);
    const auto* r = std::get_if<Real>(&value);
    const bool recheck = (r != nullptr && !std::isfinite(*r)) ||
                         std::holds_alternative<Integer>(value) ||
                         std::holds_alternative<Complex>(slot);
    Entry previous = std::exchange(slot, std::move(value));
    if (recheck) {
      try {
        check_integer_representable();
      } catch (const unsupported_coercion&) {
        storage_.get(row, col) = std::move(previous);
        throw;
      }
    }
    mode_cache_.store(kUnresolved);
  }

  template <std::integral I>
  void set(size_t row, size_t col, I value) {
    set(row, col, Entry{static_cast<Real>(value)});
  }

  // ===== Transformations =====

  Matrix transpose() const {
    DenseStorage<Entry> result(cols(), rows());
    for (size_t i = 0; i < rows(); ++i)
      for (size_t j = 0; j < cols(); ++j)
        result.get(j, i) = storage_.get(i, j);
    return Matrix(std::move(result), mode());
  }

  Matrix conjugate_transpose() const {
    DenseStorage<Entry> result(cols(), rows());
    for (size_t i = 0; i < rows(); ++i) {
      for (size_t j = 0; j < cols(); ++j) {
        const Entry& val = storage_.get(i, j);
        if (const auto* c = std::get_if<Complex>(&val))
          result.get(j, i) = ComplexOps::wrap(ComplexOps::conjugate(*c));
        else
          result.get(j, i) = val;
      }
    }
    return Matrix(std::move(result), mode());
  }

  // Both operands are coerced into the wider of the two modes first.
  Matrix multiply(const Matrix& other) const {
    if (cols() != other.rows())
      throw dimension_mismatch(fmt::format("cannot multiply {} by {}",
                                           dimension(), other.dimension()));

    const NumericMode combined = promote(mode(), other.mode());
    return with_ops(combined, [&](auto ops) {
      using Ops = decltype(ops);
      return from_typed<Ops>(
          kernels::multiply<Ops>(typed<Ops>(), other.typed<Ops>()));
    });
  }

  Matrix operator*(const Matrix& rhs) const { return multiply(rhs); }

  // Matrices of different modes are never equal.
  bool equals(const Matrix& other, double tol = HYMAT_DEFAULT_TOLERANCE) const {
    if (rows() != other.rows() || cols() != other.cols())
      return false;
    if (mode() != other.mode())
      return false;

    return visit_typed([&](auto ops, const auto& a) {
      using Ops = decltype(ops);
      const auto b = other.typed<Ops>();
      for (size_t i = 0; i < rows(); ++i)
        for (size_t j = 0; j < cols(); ++j)
          if (!Ops::eq(a.get(i, j), b.get(i, j), tol))
            return false;
      return true;
    });
  }

  // ===== Structural Predicates =====

  bool is_square() const noexcept { return rows() == cols(); }

  bool is_row_matrix() const noexcept { return rows() == 1; }

  bool is_column_matrix() const noexcept { return cols() == 1; }

  bool is_zero_matrix() const {
    return visit_typed([&](auto ops, const auto& a) {
      using Ops = decltype(ops);
      return std::all_of(a.begin(), a.end(),
                         [](const auto& v) { return Ops::is_zero(v); });
    });
  }

  bool is_identity() const {
    if (!is_square())
      return false;
    return visit_typed([&](auto ops, const auto& a) {
      using Ops = decltype(ops);
      for (size_t i = 0; i < rows(); ++i) {
        for (size_t j = 0; j < cols(); ++j) {
          const bool ok = i == j ? Ops::eq(a.get(i, j), Ops::one())
                                 : Ops::is_zero(a.get(i, j));
          if (!ok)
            return false;
        }
      }
      return true;
    });
  }

  bool is_diagonal() const {
    if (!is_square())
      return false;
    return visit_typed([&](auto ops, const auto& a) {
      using Ops = decltype(ops);
      for (size_t i = 0; i < rows(); ++i)
        for (size_t j = 0; j < cols(); ++j)
          if (i != j && !Ops::is_zero(a.get(i, j)))
            return false;
      return true;
    });
  }

  // Diagonal, and every diagonal entry equal to the first.
  bool is_scalar_matrix() const {
    if (!is_diagonal())
      return false;
    return visit_typed([&](auto ops, const auto& a) {
      using Ops = decltype(ops);
      for (size_t i = 1; i < rows(); ++i)
        if (!Ops::eq(a.get(i, i), a.get(0, 0)))
          return false;
      return true;
    });
  }

  // A == A^T. For complex matrices this is not the Hermitian test.
  bool is_symmetric() const {
    if (!is_square())
      return false;
    return visit_typed([&](auto ops, const auto& a) {
      using Ops = decltype(ops);
      for (size_t i = 0; i < rows(); ++i)
        for (size_t j = 0; j < i; ++j)
          if (!Ops::eq(a.get(i, j), a.get(j, i)))
            return false;
      return true;
    });
  }

  // A == A^H
  bool is_hermitian() const {
    if (!is_square())
      return false;
    return visit_typed([&](auto ops, const auto& a) {
      using Ops = decltype(ops);
      for (size_t i = 0; i < rows(); ++i)
        for (size_t j = 0; j <= i; ++j)
          if (!Ops::eq(a.get(i, j), Ops::conjugate(a.get(j, i))))
            return false;
      return true;
    });
  }

  bool is_upper_triangular() const {
    if (!is_square())
      return false;
    return visit_typed([&](auto ops, const auto& a) {
      using Ops = decltype(ops);
      for (size_t i = 1; i < rows(); ++i)
        for (size_t j = 0; j < i; ++j)
          if (!Ops::is_zero(a.get(i, j)))
            return false;
      return true;
    });
  }

  bool is_lower_triangular() const {
    if (!is_square())
      return false;
    return visit_typed([&](auto ops, const auto& a) {
      using Ops = decltype(ops);
      for (size_t i = 0; i < rows(); ++i)
        for (size_t j = i + 1; j < cols(); ++j)
          if (!Ops::is_zero(a.get(i, j)))
            return false;
      return true;
    });
  }

  // Orthogonal (real) or unitary (complex): A * A^T, resp. A * A^H, is the
  // identity within tol.
  bool is_orthogonal(double tol = HYMAT_DEFAULT_TOLERANCE) const {
    const NumericMode m = mode();
    if (m == NumericMode::ArbitraryInteger)
      throw unsupported_operation(
          "orthogonal/unitary check not supported in integer mode");
    if (!is_square())
      return false;

    const Matrix adjoint =
        m == NumericMode::Complex ? conjugate_transpose() : transpose();
    return multiply(adjoint).equals(identity(rows(), m), tol);
  }

  // ===== Elimination =====

  Entry determinant() const {
    if (!is_square())
      throw not_square("determinant only defined for square matrices");
    return visit_typed([](auto ops, auto a) {
      using Ops = decltype(ops);
      return Ops::wrap(elimination::determinant<Ops>(std::move(a)));
    });
  }

  Matrix inverse() const {
    if (!is_square())
      throw not_square("inverse only defined for square matrices");
    return visit_typed([](auto ops, const auto& a) {
      using Ops = decltype(ops);
      return from_typed<Ops>(elimination::inverse<Ops>(a));
    });
  }

  size_t rank(double tol = HYMAT_DEFAULT_TOLERANCE) const {
    return visit_typed([tol](auto ops, auto a) {
      using Ops = decltype(ops);
      return elimination::rank<Ops>(std::move(a), tol);
    });
  }

  // ===== Classification =====

  MatrixType classify() const {
    if (is_zero_matrix())
      return MatrixType::Zero;
    if (is_identity())
      return MatrixType::Identity;
    if (is_diagonal())
      return MatrixType::Diagonal;
    if (is_scalar_matrix())
      return MatrixType::Scalar;
    if (is_hermitian())
      return MatrixType::Hermitian;
    if (is_symmetric())
      return MatrixType::Symmetric;
    if (is_upper_triangular())
      return MatrixType::UpperTriangular;
    if (is_lower_triangular())
      return MatrixType::LowerTriangular;
    if (is_row_matrix())
      return MatrixType::Row;
    if (is_column_matrix())
      return MatrixType::Column;
    if (is_square())
      return MatrixType::Square;
    return MatrixType::Rectangular;
  }

  std::string type() const { return to_string(classify()); }

  friend std::ostream& operator<<(std::ostream& os, const Matrix& m);
};

// ==================== Free Functions ====================

inline std::ostream& operator<<(std::ostream& os, const Matrix& m) {
  m.visit_typed([&](auto ops, const auto& a) {
    using Ops = decltype(ops);
    os << "[";
    for (size_t i = 0; i < a.rows(); ++i) {
      os << (i == 0 ? "[" : " [");
      for (size_t j = 0; j < a.cols(); ++j) {
        os << Ops::to_display(a.get(i, j));
        if (j < a.cols() - 1)
          os << ", ";
      }
      os << "]";
      if (i < a.rows() - 1)
        os << ",\n";
    }
    os << "]";
    return 0;
  });
  return os;
}

}  // namespace hymat
#endif  // HYMAT_MATRIX_HPP
