#ifndef HYMAT_TYPES_HPP
#define HYMAT_TYPES_HPP

#include <gmpxx.h>
#include <complex>
#include <concepts>
#include <cstddef>
#include <string>
#include <type_traits>
#include <variant>

namespace hymat {

using Real = double;
using Integer = mpz_class;
using Complex = std::complex<double>;

// Alternative order matches NumericMode so that index() is the entry's mode.
using Entry = std::variant<Real, Integer, Complex>;

// Ordered by promotion precedence: Complex > ArbitraryInteger > Real
enum class NumericMode { Real = 0, ArbitraryInteger = 1, Complex = 2 };

static_assert(std::variant_size_v<Entry> == 3);
static_assert(std::is_same_v<std::variant_alternative_t<
                                 static_cast<size_t>(NumericMode::Complex),
                                 Entry>,
                             Complex>);

constexpr NumericMode promote(NumericMode a, NumericMode b) noexcept {
  return a < b ? b : a;
}

inline std::string to_string(NumericMode mode) {
  switch (mode) {
    case NumericMode::Real:
      return "real";
    case NumericMode::ArbitraryInteger:
      return "integer";
    case NumericMode::Complex:
      return "complex";
  }
  return "unknown";
}

// A stateless bundle of arithmetic bound to one numeric mode.
template <typename Ops>
concept NumericOps =
    requires(const typename Ops::value_type& a,
             const typename Ops::value_type& b, const Entry& e, double tol) {
      typename Ops::value_type;
      { Ops::mode } -> std::convertible_to<NumericMode>;
      { Ops::zero() } -> std::same_as<typename Ops::value_type>;
      { Ops::one() } -> std::same_as<typename Ops::value_type>;
      { Ops::add(a, b) } -> std::same_as<typename Ops::value_type>;
      { Ops::sub(a, b) } -> std::same_as<typename Ops::value_type>;
      { Ops::mul(a, b) } -> std::same_as<typename Ops::value_type>;
      { Ops::div(a, b) } -> std::same_as<typename Ops::value_type>;
      { Ops::eq(a, b, tol) } -> std::same_as<bool>;
      { Ops::is_zero(a, tol) } -> std::same_as<bool>;
      { Ops::conjugate(a) } -> std::same_as<typename Ops::value_type>;
      { Ops::to_display(a) } -> std::same_as<std::string>;
      { Ops::wrap(a) } -> std::same_as<Entry>;
      { Ops::unwrap(e) } -> std::same_as<typename Ops::value_type>;
    };

}  // namespace hymat
#endif  // HYMAT_TYPES_HPP
