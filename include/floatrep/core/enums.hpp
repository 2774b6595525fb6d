#ifndef FLOATREP_CORE_ENUMS_HPP
#define FLOATREP_CORE_ENUMS_HPP

namespace floatrep {

enum class FloatClass {
  Normal,           // biased exponent field in [1, 2^E - 2], implicit leading 1
  Subnormal,        // exponent field zero, non-zero significand
  Zero,             // exponent and significand fields zero
  PositiveInfinity, // exponent field all ones, significand zero, sign clear
  NegativeInfinity, // exponent field all ones, significand zero, sign set
  NaN               // exponent field all ones, non-zero significand
};

enum class RoundingMode {
  HalfToEven, // nearest, ties to the even kept value
  TowardZero  // truncate everything beyond the significand
};

enum class Notation { Plain, Scientific };

// How hexadecimal text wider than the format is treated.
enum class HexPolicy {
  Lenient, // keep the least-significant bits
  Strict   // reject surplus digits and non-zero bits above the width
};

inline const char *className(FloatClass C) {
  switch (C) {
  case FloatClass::Normal:           return "Normal";
  case FloatClass::Subnormal:        return "Subnormal";
  case FloatClass::Zero:             return "Zero";
  case FloatClass::PositiveInfinity: return "PositiveInfinity";
  case FloatClass::NegativeInfinity: return "NegativeInfinity";
  case FloatClass::NaN:              return "NaN";
  }
  return "???";
}

inline const char *roundingModeName(RoundingMode M) {
  switch (M) {
  case RoundingMode::HalfToEven: return "half-even";
  case RoundingMode::TowardZero: return "toward-zero";
  }
  return "???";
}

inline const char *notationName(Notation N) {
  switch (N) {
  case Notation::Plain:      return "plain";
  case Notation::Scientific: return "scientific";
  }
  return "???";
}

inline constexpr bool isInfinity(FloatClass C) {
  return C == FloatClass::PositiveInfinity || C == FloatClass::NegativeInfinity;
}

// True for the classes that have an exact rational value.
inline constexpr bool isFinite(FloatClass C) {
  return C == FloatClass::Normal || C == FloatClass::Subnormal ||
         C == FloatClass::Zero;
}

} // namespace floatrep

#endif // FLOATREP_CORE_ENUMS_HPP
