#ifndef FLOATREP_CORE_QUANTIZE_HPP
#define FLOATREP_CORE_QUANTIZE_HPP

// quantize: place an exact value into a binary format.
//
//   exact zero        -> Zero
//   +-Inf, NaN        -> matching class, Exponent = bias + 1
//   |v| >= 2^(bias+1) -> signed infinity
//   normal range      -> 1.f * 2^e, f rounded to MantBits
//   subnormal range   -> 0.f * 2^emin, f rounded to MantBits
//
// Rounding may carry: a normal significand that overflows bumps the
// exponent (and may reach infinity); a subnormal one that overflows
// becomes the smallest normal.

#include <utility>

#include <gmpxx.h>

#include "floatrep/core/enums.hpp"
#include "floatrep/core/float.hpp"
#include "floatrep/core/format.hpp"
#include "floatrep/core/rational.hpp"
#include "floatrep/core/rounding.hpp"
#include "floatrep/core/value.hpp"

namespace floatrep {

namespace detail {

inline ClassifiedFloat quantizeNormal(const mpq_class &Abs, bool Sign, int Exp,
                                      const FormatDescriptor &Fmt,
                                      RoundingMode Mode) {
  // Abs / 2^Exp lies in [1, 2); drop the implicit one.
  mpq_class Fraction = Abs * pow2(-Exp) - 1;
  FractionBits Extracted =
      extractFractionBits(Fraction, Fmt.MantBits + ExtraBits);
  RoundedSignificand Rounded =
      roundSignificand(Extracted, Fmt.MantBits, Mode);

  if (Rounded.Carry)
    ++Exp;
  if (Exp > Fmt.maxExponent())
    return makeInfinity(Sign, Fmt);
  return {FloatClass::Normal, Sign, Exp, std::move(Rounded.Value)};
}

inline ClassifiedFloat quantizeSubnormal(const mpq_class &Abs, bool Sign,
                                         const FormatDescriptor &Fmt,
                                         RoundingMode Mode) {
  // No implicit one: Abs / 2^emin lies in (0, 1).
  mpq_class Fraction = Abs * pow2(-Fmt.minExponent());
  FractionBits Extracted =
      extractFractionBits(Fraction, Fmt.MantBits + ExtraBits);
  RoundedSignificand Rounded =
      roundSignificand(Extracted, Fmt.MantBits, Mode);

  if (Rounded.Carry)
    return {FloatClass::Normal, Sign, Fmt.minExponent(), mpz_class(0)};
  if (Rounded.Value == 0)
    return makeZero(Sign, Fmt);
  return {FloatClass::Subnormal, Sign, Fmt.minExponent(),
          std::move(Rounded.Value)};
}

} // namespace detail

// Quantize a finite rational.
inline ClassifiedFloat quantize(const mpq_class &Value,
                                const FormatDescriptor &Fmt,
                                RoundingMode Mode) {
  if (Value == 0)
    return makeZero(false, Fmt);

  bool Sign = sgn(Value) < 0;
  mpq_class Abs = abs(Value);
  int Exp = floorLog2(Abs);

  if (Exp > Fmt.maxExponent())
    return makeInfinity(Sign, Fmt);
  if (Exp >= Fmt.minExponent())
    return detail::quantizeNormal(Abs, Sign, Exp, Fmt, Mode);
  return detail::quantizeSubnormal(Abs, Sign, Fmt, Mode);
}

inline ClassifiedFloat quantize(const ExactValue &Value,
                                const FormatDescriptor &Fmt,
                                RoundingMode Mode) {
  if (const mpq_class *R = Value.rational())
    return quantize(*R, Fmt, Mode);
  if (Value.isPositiveInfinity())
    return makeInfinity(false, Fmt);
  if (Value.isNegativeInfinity())
    return makeInfinity(true, Fmt);
  return makeNaN(false, Fmt);
}

} // namespace floatrep

#endif // FLOATREP_CORE_QUANTIZE_HPP
