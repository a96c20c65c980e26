#ifndef HYMAT_COERCION_HPP
#define HYMAT_COERCION_HPP

#include <cmath>
#include <iterator>
#include <variant>
#include "matrix_error.hpp"
#include "types.hpp"

namespace hymat {

inline NumericMode mode_of(const Entry& value) noexcept {
  return static_cast<NumericMode>(value.index());
}

// ==================== Mode Detection ====================

// Any Complex entry wins; otherwise any Integer entry; otherwise Real.
// An empty range is Real.
template <std::input_iterator It>
NumericMode detect_mode(It first, It last) {
  NumericMode mode = NumericMode::Real;
  for (; first != last; ++first) {
    mode = promote(mode, mode_of(*first));
    if (mode == NumericMode::Complex)
      break;
  }
  return mode;
}

// ==================== Coercion ====================

// Converts one entry into `target`. Real -> Integer truncates toward zero;
// every other successful conversion is lossless.
inline Result<Entry> coerce(const Entry& value, NumericMode target) {
  switch (target) {
    case NumericMode::Complex:
      if (const auto* r = std::get_if<Real>(&value))
        return Entry{std::in_place_type<Complex>, *r, 0.0};
      if (const auto* z = std::get_if<Integer>(&value))
        return Entry{std::in_place_type<Complex>, z->get_d(), 0.0};
      return value;

    case NumericMode::ArbitraryInteger:
      if (const auto* r = std::get_if<Real>(&value)) {
        if (!std::isfinite(*r))
          return ErrorCode::UNSUPPORTED_COERCION;
        return Entry{std::in_place_type<Integer>, std::trunc(*r)};
      }
      if (std::holds_alternative<Complex>(value))
        return ErrorCode::UNSUPPORTED_COERCION;
      return value;

    case NumericMode::Real:
      if (const auto* z = std::get_if<Integer>(&value))
        return Entry{std::in_place_type<Real>, z->get_d()};
      if (const auto* c = std::get_if<Complex>(&value)) {
        if (c->imag() != 0.0)
          return ErrorCode::UNSUPPORTED_COERCION;
        return Entry{std::in_place_type<Real>, c->real()};
      }
      return value;
  }
  return ErrorCode::UNSUPPORTED_COERCION;
}

// True when a Real entry would lose a fractional part in integer mode.
inline bool truncates_in_integer_mode(const Entry& value) {
  const auto* r = std::get_if<Real>(&value);
  return r != nullptr && std::isfinite(*r) && std::trunc(*r) != *r;
}

}  // namespace hymat
#endif  // HYMAT_COERCION_HPP
