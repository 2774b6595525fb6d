#ifndef FLOATREP_CORE_FLOAT_HPP
#define FLOATREP_CORE_FLOAT_HPP

#include <optional>

#include <gmpxx.h>

#include "floatrep/core/enums.hpp"
#include "floatrep/core/format.hpp"
#include "floatrep/core/rational.hpp"

namespace floatrep {

// A value placed in a format: class, sign, unbiased exponent and the
// stored fraction bits (no implicit leading one).
//
// Conventions:
//   Zero, Subnormal    Exponent == minExponent()
//   Infinity, NaN      Exponent == maxExponent() + 1
//   NaN                Significand == 0 (the all-ones field is produced
//                      by the encoder only)
//   always             Significand < 2^MantBits
struct ClassifiedFloat {
  FloatClass Class = FloatClass::Zero;
  bool Sign = false;
  int Exponent = 0;
  mpz_class Significand;

  friend bool operator==(const ClassifiedFloat &A, const ClassifiedFloat &B) {
    return A.Class == B.Class && A.Sign == B.Sign && A.Exponent == B.Exponent &&
           A.Significand == B.Significand;
  }
};

inline ClassifiedFloat makeZero(bool Sign, const FormatDescriptor &Fmt) {
  return {FloatClass::Zero, Sign, Fmt.minExponent(), mpz_class(0)};
}

inline ClassifiedFloat makeInfinity(bool Sign, const FormatDescriptor &Fmt) {
  return {Sign ? FloatClass::NegativeInfinity : FloatClass::PositiveInfinity,
          Sign, Fmt.specialExponent(), mpz_class(0)};
}

inline ClassifiedFloat makeNaN(bool Sign, const FormatDescriptor &Fmt) {
  return {FloatClass::NaN, Sign, Fmt.specialExponent(), mpz_class(0)};
}

// The exact value held by the encoding. Empty for infinities and NaN.
inline std::optional<mpq_class> toRational(const ClassifiedFloat &F,
                                           const FormatDescriptor &Fmt) {
  mpq_class Value;
  switch (F.Class) {
  case FloatClass::PositiveInfinity:
  case FloatClass::NegativeInfinity:
  case FloatClass::NaN:
    return std::nullopt;
  case FloatClass::Zero:
    return mpq_class(0);
  case FloatClass::Subnormal:
    // 0.s * 2^emin
    Value = mpq_class(F.Significand) * pow2(Fmt.minExponent() - Fmt.MantBits);
    break;
  case FloatClass::Normal:
    // 1.s * 2^e
    Value = (mpq_class(F.Significand) * pow2(-Fmt.MantBits) + 1) *
            pow2(F.Exponent);
    break;
  }
  Value.canonicalize();
  if (F.Sign)
    Value = -Value;
  return Value;
}

} // namespace floatrep

#endif // FLOATREP_CORE_FLOAT_HPP
