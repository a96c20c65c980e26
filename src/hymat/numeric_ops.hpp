#ifndef HYMAT_NUMERIC_OPS_HPP
#define HYMAT_NUMERIC_OPS_HPP

#include <fmt/format.h>
#include <gmp.h>
#include <cmath>
#include <string>
#include <utility>
#include <variant>
#include "library_config.hpp"
#include "matrix_error.hpp"
#include "types.hpp"

namespace hymat {

namespace detail {
// Folds negative zero so that displays never read "-0".
inline double unsigned_zero(double x) {
  return x == 0.0 ? 0.0 : x;
}
}  // namespace detail

// ==================== Operation Sets ====================

struct RealOps {
  using value_type = Real;
  static constexpr NumericMode mode = NumericMode::Real;
  static constexpr bool exact = false;

  static Real zero() { return 0.0; }
  static Real one() { return 1.0; }

  static Real add(const Real& a, const Real& b) { return a + b; }
  static Real sub(const Real& a, const Real& b) { return a - b; }
  static Real mul(const Real& a, const Real& b) { return a * b; }

  static Real div(const Real& a, const Real& b) {
    if (b == 0.0)
      throw divide_by_zero("division by zero (real)");
    return a / b;
  }

  static bool eq(const Real& a, const Real& b,
                 double tol = HYMAT_DEFAULT_TOLERANCE) {
    return std::abs(a - b) < tol;
  }

  static bool is_zero(const Real& a, double tol = HYMAT_DEFAULT_TOLERANCE) {
    return std::abs(a) < tol;
  }

  static Real conjugate(const Real& a) { return a; }

  static std::string to_display(const Real& a) {
    return fmt::format("{}", detail::unsigned_zero(a));
  }

  static Entry wrap(const Real& a) {
    return Entry{std::in_place_type<Real>, a};
  }
  static Real unwrap(const Entry& e) { return std::get<Real>(e); }
};

// Exact GMP arithmetic. Division is only defined when it leaves no remainder.
struct IntegerOps {
  using value_type = Integer;
  static constexpr NumericMode mode = NumericMode::ArbitraryInteger;
  static constexpr bool exact = true;

  static Integer zero() { return Integer(0); }
  static Integer one() { return Integer(1); }

  static Integer add(const Integer& a, const Integer& b) {
    return Integer(a + b);
  }
  static Integer sub(const Integer& a, const Integer& b) {
    return Integer(a - b);
  }
  static Integer mul(const Integer& a, const Integer& b) {
    return Integer(a * b);
  }

  static Integer div(const Integer& a, const Integer& b) {
    if (sgn(b) == 0)
      throw divide_by_zero("division by zero (integer)");
    if (mpz_divisible_p(a.get_mpz_t(), b.get_mpz_t()) == 0)
      throw non_exact_division(fmt::format(
          "non-exact division {} / {} in integer mode", a.get_str(),
          b.get_str()));
    Integer q;
    mpz_divexact(q.get_mpz_t(), a.get_mpz_t(), b.get_mpz_t());
    return q;
  }

  static bool eq(const Integer& a, const Integer& b,
                 double /*tol*/ = HYMAT_DEFAULT_TOLERANCE) {
    return a == b;
  }

  static bool is_zero(const Integer& a,
                      double /*tol*/ = HYMAT_DEFAULT_TOLERANCE) {
    return sgn(a) == 0;
  }

  static Integer conjugate(const Integer& a) { return a; }

  static std::string to_display(const Integer& a) { return a.get_str(); }

  static Entry wrap(const Integer& a) {
    return Entry{std::in_place_type<Integer>, a};
  }
  static Integer unwrap(const Entry& e) { return std::get<Integer>(e); }
};

struct ComplexOps {
  using value_type = Complex;
  static constexpr NumericMode mode = NumericMode::Complex;
  static constexpr bool exact = false;

  static Complex zero() { return Complex(0.0, 0.0); }
  static Complex one() { return Complex(1.0, 0.0); }

  static Complex add(const Complex& a, const Complex& b) {
    return Complex(a.real() + b.real(), a.imag() + b.imag());
  }
  static Complex sub(const Complex& a, const Complex& b) {
    return Complex(a.real() - b.real(), a.imag() - b.imag());
  }
  static Complex mul(const Complex& a, const Complex& b) {
    return Complex(a.real() * b.real() - a.imag() * b.imag(),
                   a.real() * b.imag() + a.imag() * b.real());
  }

  static Complex div(const Complex& a, const Complex& b) {
    const double denom = b.real() * b.real() + b.imag() * b.imag();
    if (denom == 0.0)
      throw divide_by_zero("division by zero (complex)");
    return Complex((a.real() * b.real() + a.imag() * b.imag()) / denom,
                   (a.imag() * b.real() - a.real() * b.imag()) / denom);
  }

  static bool eq(const Complex& a, const Complex& b,
                 double tol = HYMAT_DEFAULT_TOLERANCE) {
    return std::abs(a.real() - b.real()) < tol &&
           std::abs(a.imag() - b.imag()) < tol;
  }

  static bool is_zero(const Complex& a,
                      double tol = HYMAT_DEFAULT_TOLERANCE) {
    return std::abs(a.real()) < tol && std::abs(a.imag()) < tol;
  }

  static Complex conjugate(const Complex& a) {
    return Complex(a.real(), -a.imag());
  }

  // "re+imi" or "re-imi"
  static std::string to_display(const Complex& a) {
    const double re = detail::unsigned_zero(a.real());
    const double im = detail::unsigned_zero(a.imag());
    return fmt::format("{}{}{}i", re, im >= 0.0 ? "+" : "", im);
  }

  static Entry wrap(const Complex& a) {
    return Entry{std::in_place_type<Complex>, a};
  }
  static Complex unwrap(const Entry& e) { return std::get<Complex>(e); }
};

static_assert(NumericOps<RealOps>);
static_assert(NumericOps<IntegerOps>);
static_assert(NumericOps<ComplexOps>);

// ==================== Dispatcher ====================

// Calls `visitor` with the operation set bound to `mode`. Every branch must
// yield the same type.
template <typename Visitor>
auto with_ops(NumericMode mode, Visitor&& visitor) {
  switch (mode) {
    case NumericMode::Complex:
      return std::forward<Visitor>(visitor)(ComplexOps{});
    case NumericMode::ArbitraryInteger:
      return std::forward<Visitor>(visitor)(IntegerOps{});
    case NumericMode::Real:
      break;
  }
  return std::forward<Visitor>(visitor)(RealOps{});
}

}  // namespace hymat
#endif  // HYMAT_NUMERIC_OPS_HPP
