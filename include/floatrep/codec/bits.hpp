#ifndef FLOATREP_CODEC_BITS_HPP
#define FLOATREP_CODEC_BITS_HPP

// Bit-string codec: ClassifiedFloat <-> "S EEE..E MMM..M" as a string of
// exactly 1 + E + M characters '0'/'1', MSB first.

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include <gmpxx.h>

#include "floatrep/core/enums.hpp"
#include "floatrep/core/errors.hpp"
#include "floatrep/core/float.hpp"
#include "floatrep/core/format.hpp"
#include "floatrep/text/strings.hpp"

namespace floatrep {

namespace detail {

// Unsigned Value as exactly Width binary digits, zero-padded on the left.
inline std::string binaryField(const mpz_class &Value, int Width) {
  std::string Digits = Value == 0 ? std::string() : Value.get_str(2);
  if (sgn(Value) < 0 || static_cast<int>(Digits.size()) > Width)
    throw FormatError("field value " + Value.get_str() + " does not fit in " +
                      std::to_string(Width) + " bits");
  return std::string(Width - static_cast<int>(Digits.size()), '0') + Digits;
}

} // namespace detail

inline std::string encodeBits(const ClassifiedFloat &F,
                              const FormatDescriptor &Fmt) {
  std::string Out;
  Out.reserve(static_cast<std::size_t>(Fmt.totalBits()));
  Out += F.Sign ? '1' : '0';

  switch (F.Class) {
  case FloatClass::PositiveInfinity:
  case FloatClass::NegativeInfinity:
    Out.append(Fmt.ExpBits, '1');
    Out.append(Fmt.MantBits, '0');
    break;
  case FloatClass::NaN:
    Out.append(Fmt.ExpBits, '1');
    Out.append(Fmt.MantBits, '1');
    break;
  case FloatClass::Zero:
  case FloatClass::Subnormal:
    Out.append(Fmt.ExpBits, '0');
    Out += detail::binaryField(F.Significand, Fmt.MantBits);
    break;
  case FloatClass::Normal:
    Out += detail::binaryField(mpz_class(F.Exponent + Fmt.bias()),
                               Fmt.ExpBits);
    Out += detail::binaryField(F.Significand, Fmt.MantBits);
    break;
  }
  return Out;
}

// Accepts surrounding whitespace and an optional 0b/0B prefix. Throws
// FormatError on a length mismatch or a non-binary character.
inline ClassifiedFloat decodeBits(std::string_view Text,
                                  const FormatDescriptor &Fmt) {
  std::string_view Bits = stripRadixPrefix(trimSpace(Text), 'b');
  const auto Total = static_cast<std::size_t>(Fmt.totalBits());
  if (Bits.size() != Total)
    throw FormatError("expected " + std::to_string(Total) + " bits, got " +
                      std::to_string(Bits.size()));
  if (Bits.find_first_not_of("01") != std::string_view::npos)
    throw FormatError("bits must contain only 0 or 1");

  bool Sign = Bits[0] == '1';
  std::string_view ExpField = Bits.substr(1, Fmt.ExpBits);
  std::string_view MantField = Bits.substr(1 + Fmt.ExpBits);
  mpz_class Significand(std::string(MantField), 2);

  bool ExpAllOnes = ExpField.find('0') == std::string_view::npos;
  bool ExpAllZeros = ExpField.find('1') == std::string_view::npos;

  if (ExpAllOnes) {
    if (Significand == 0)
      return makeInfinity(Sign, Fmt);
    return makeNaN(Sign, Fmt);
  }
  if (ExpAllZeros) {
    if (Significand == 0)
      return makeZero(Sign, Fmt);
    return {FloatClass::Subnormal, Sign, Fmt.minExponent(),
            std::move(Significand)};
  }

  int Biased = 0;
  for (char C : ExpField)
    Biased = Biased * 2 + (C - '0');
  return {FloatClass::Normal, Sign, Biased - Fmt.bias(),
          std::move(Significand)};
}

} // namespace floatrep

#endif // FLOATREP_CODEC_BITS_HPP
