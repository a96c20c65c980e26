#ifndef HYMAT_MATRIX_ERROR_HPP
#define HYMAT_MATRIX_ERROR_HPP

#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace hymat {

// ==============================================
// Core Error Types
// ==============================================

enum class ErrorCode {
  INVALID_DIMENSIONS,     // Non-positive row or column count
  SHAPE_MISMATCH,         // Jagged input grid
  OUT_OF_BOUNDS,          // Element index outside the grid
  DIMENSION_MISMATCH,     // Operand shapes incompatible for the operation
  NOT_SQUARE,             // Operation requires a square matrix
  DIVIDE_BY_ZERO,         // Division by the additive identity
  NON_EXACT_DIVISION,     // Integer quotient with a remainder
  UNSUPPORTED_OPERATION,  // Operation not defined for the active mode
  UNSUPPORTED_COERCION,   // Value cannot be represented in the target mode
  SINGULAR_MATRIX         // Matrix is non-invertible
};

inline const char* describe(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::INVALID_DIMENSIONS:
      return "rows and cols must be positive integers";
    case ErrorCode::SHAPE_MISMATCH:
      return "jagged array not supported";
    case ErrorCode::OUT_OF_BOUNDS:
      return "row or column index is out of range";
    case ErrorCode::DIMENSION_MISMATCH:
      return "matrix/matricies not compatible sizes";
    case ErrorCode::NOT_SQUARE:
      return "matrix must be square";
    case ErrorCode::DIVIDE_BY_ZERO:
      return "division by zero occured!";
    case ErrorCode::NON_EXACT_DIVISION:
      return "non-exact division encountered in integer mode";
    case ErrorCode::UNSUPPORTED_OPERATION:
      return "operation not supported for this numeric mode";
    case ErrorCode::UNSUPPORTED_COERCION:
      return "value cannot be coerced to the target numeric mode";
    case ErrorCode::SINGULAR_MATRIX:
      return "matrix is singular (non-invertible)";
  }
  return "unknown matrix error";
}

class MatrixException : public std::runtime_error {
 public:
  MatrixException(ErrorCode code, const std::string& msg,
                  std::source_location loc = std::source_location::current())
      : std::runtime_error(msg), m_code(code), m_location(loc) {}

  ErrorCode code() const noexcept { return m_code; }
  const std::source_location& where() const noexcept { return m_location; }

 private:
  ErrorCode m_code;
  std::source_location m_location;
};

struct invalid_dimensions : public MatrixException {
  explicit invalid_dimensions(
      const std::string& msg = describe(ErrorCode::INVALID_DIMENSIONS),
      std::source_location loc = std::source_location::current())
      : MatrixException(ErrorCode::INVALID_DIMENSIONS, msg, loc) {}
};

struct shape_mismatch : public MatrixException {
  explicit shape_mismatch(
      const std::string& msg = describe(ErrorCode::SHAPE_MISMATCH),
      std::source_location loc = std::source_location::current())
      : MatrixException(ErrorCode::SHAPE_MISMATCH, msg, loc) {}
};

struct index_out_of_range : public MatrixException {
  explicit index_out_of_range(
      const std::string& msg = describe(ErrorCode::OUT_OF_BOUNDS),
      std::source_location loc = std::source_location::current())
      : MatrixException(ErrorCode::OUT_OF_BOUNDS, msg, loc) {}
};

struct dimension_mismatch : public MatrixException {
  explicit dimension_mismatch(
      const std::string& msg = describe(ErrorCode::DIMENSION_MISMATCH),
      std::source_location loc = std::source_location::current())
      : MatrixException(ErrorCode::DIMENSION_MISMATCH, msg, loc) {}
};

struct not_square : public MatrixException {
  explicit not_square(const std::string& msg = describe(ErrorCode::NOT_SQUARE),
                      std::source_location loc =
                          std::source_location::current())
      : MatrixException(ErrorCode::NOT_SQUARE, msg, loc) {}
};

struct divide_by_zero : public MatrixException {
  explicit divide_by_zero(
      const std::string& msg = describe(ErrorCode::DIVIDE_BY_ZERO),
      std::source_location loc = std::source_location::current())
      : MatrixException(ErrorCode::DIVIDE_BY_ZERO, msg, loc) {}
};

struct non_exact_division : public MatrixException {
  explicit non_exact_division(
      const std::string& msg = describe(ErrorCode::NON_EXACT_DIVISION),
      std::source_location loc = std::source_location::current())
      : MatrixException(ErrorCode::NON_EXACT_DIVISION, msg, loc) {}
};

struct unsupported_operation : public MatrixException {
  explicit unsupported_operation(
      const std::string& msg = describe(ErrorCode::UNSUPPORTED_OPERATION),
      std::source_location loc = std::source_location::current())
      : MatrixException(ErrorCode::UNSUPPORTED_OPERATION, msg, loc) {}

 protected:
  unsupported_operation(ErrorCode code, const std::string& msg,
                        std::source_location loc)
      : MatrixException(code, msg, loc) {}
};

struct unsupported_coercion : public unsupported_operation {
  explicit unsupported_coercion(
      const std::string& msg = describe(ErrorCode::UNSUPPORTED_COERCION),
      std::source_location loc = std::source_location::current())
      : unsupported_operation(ErrorCode::UNSUPPORTED_COERCION, msg, loc) {}
};

struct singular_matrix : public MatrixException {
  explicit singular_matrix(
      const std::string& msg = describe(ErrorCode::SINGULAR_MATRIX),
      std::source_location loc = std::source_location::current())
      : MatrixException(ErrorCode::SINGULAR_MATRIX, msg, loc) {}
};

// Raises the typed exception matching `code`.
[[noreturn]] inline void throw_error(
    ErrorCode code, const std::string& msg,
    std::source_location loc = std::source_location::current()) {
  switch (code) {
    case ErrorCode::INVALID_DIMENSIONS:
      throw invalid_dimensions(msg, loc);
    case ErrorCode::SHAPE_MISMATCH:
      throw shape_mismatch(msg, loc);
    case ErrorCode::OUT_OF_BOUNDS:
      throw index_out_of_range(msg, loc);
    case ErrorCode::DIMENSION_MISMATCH:
      throw dimension_mismatch(msg, loc);
    case ErrorCode::NOT_SQUARE:
      throw not_square(msg, loc);
    case ErrorCode::DIVIDE_BY_ZERO:
      throw divide_by_zero(msg, loc);
    case ErrorCode::NON_EXACT_DIVISION:
      throw non_exact_division(msg, loc);
    case ErrorCode::UNSUPPORTED_OPERATION:
      throw unsupported_operation(msg, loc);
    case ErrorCode::UNSUPPORTED_COERCION:
      throw unsupported_coercion(msg, loc);
    case ErrorCode::SINGULAR_MATRIX:
      throw singular_matrix(msg, loc);
  }
  throw MatrixException(code, msg, loc);
}

// ==============================================
// Result Type
// ==============================================

template <typename T>
class Result {
 private:
  std::variant<T, ErrorCode> m_data;

  [[noreturn]] void fail() const {
    const ErrorCode code = std::get<ErrorCode>(m_data);
    throw_error(code, describe(code));
  }

 public:
  Result(T value) : m_data(std::move(value)) {}
  Result(ErrorCode code) : m_data(code) {}

  // State checking
  bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }
  bool is_err() const noexcept {
    return std::holds_alternative<ErrorCode>(m_data);
  }

  // Value access
  T& value() & {
    if (!is_ok())
      fail();
    return std::get<T>(m_data);
  }

  const T& value() const& {
    if (!is_ok())
      fail();
    return std::get<T>(m_data);
  }

  T&& value() && {
    if (!is_ok())
      fail();
    return std::get<T>(std::move(m_data));
  }

  // Empty when the result holds a value.
  std::optional<ErrorCode> error() const noexcept {
    if (is_ok())
      return std::nullopt;
    return std::get<ErrorCode>(m_data);
  }

  template <typename U>
  T value_or(U&& default_value) const& {
    return is_ok() ? std::get<T>(m_data)
                   : static_cast<T>(std::forward<U>(default_value));
  }

  explicit operator bool() const noexcept { return is_ok(); }
};

}  // namespace hymat
#endif  // HYMAT_MATRIX_ERROR_HPP
