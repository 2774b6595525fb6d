#ifndef FLOATREP_TEXT_PARSE_HPP
#define FLOATREP_TEXT_PARSE_HPP

// Decimal text -> ExactValue, with no rounding.
//
// Literals (case-insensitive): inf, +inf, infinity, +infinity, -inf,
// -infinity, nan. Anything else must match
//   [+-]? digits* ('.' digits*)? ([eE] [+-]? digits+)?
// with at least one digit before the exponent marker.

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include <gmpxx.h>

#include "floatrep/core/errors.hpp"
#include "floatrep/core/rational.hpp"
#include "floatrep/core/value.hpp"
#include "floatrep/text/strings.hpp"

namespace floatrep {

// Largest |decimal exponent| accepted after folding in the fraction length.
inline constexpr long MaxDecimalExponent = 1000000;

namespace detail {

inline bool isDigit(char C) {
  return std::isdigit(static_cast<unsigned char>(C)) != 0;
}

[[noreturn]] inline void badDecimal(std::string_view Text) {
  throw ParseError("unable to parse decimal input: " + std::string(Text));
}

} // namespace detail

inline ExactValue parseDecimal(std::string_view Raw) {
  std::string_view Text = trimSpace(Raw);
  std::string Lower = toLower(Text);
  if (Lower == "inf" || Lower == "+inf" || Lower == "infinity" ||
      Lower == "+infinity")
    return ExactValue::positiveInfinity();
  if (Lower == "-inf" || Lower == "-infinity")
    return ExactValue::negativeInfinity();
  if (Lower == "nan")
    return ExactValue::notANumber();

  std::size_t Pos = 0;
  bool Negative = false;
  if (Pos < Text.size() && (Text[Pos] == '+' || Text[Pos] == '-'))
    Negative = Text[Pos++] == '-';

  // Integer and fraction digits collected into one coefficient string.
  std::string Coefficient;
  long FractionDigits = 0;
  while (Pos < Text.size() && detail::isDigit(Text[Pos]))
    Coefficient += Text[Pos++];
  if (Pos < Text.size() && Text[Pos] == '.') {
    ++Pos;
    while (Pos < Text.size() && detail::isDigit(Text[Pos])) {
      Coefficient += Text[Pos++];
      ++FractionDigits;
    }
  }
  if (Coefficient.empty())
    detail::badDecimal(Raw);

  long Exponent = 0;
  if (Pos < Text.size() && (Text[Pos] == 'e' || Text[Pos] == 'E')) {
    ++Pos;
    bool NegativeExp = false;
    if (Pos < Text.size() && (Text[Pos] == '+' || Text[Pos] == '-'))
      NegativeExp = Text[Pos++] == '-';
    if (Pos == Text.size() || !detail::isDigit(Text[Pos]))
      detail::badDecimal(Raw);
    while (Pos < Text.size() && detail::isDigit(Text[Pos])) {
      Exponent = Exponent * 10 + (Text[Pos++] - '0');
      if (Exponent > 2 * MaxDecimalExponent)
        throw ParseError("decimal exponent out of range: " + std::string(Raw));
    }
    if (NegativeExp)
      Exponent = -Exponent;
  }
  if (Pos != Text.size())
    detail::badDecimal(Raw);

  long Scale = Exponent - FractionDigits;
  if (Scale > MaxDecimalExponent || Scale < -MaxDecimalExponent)
    throw ParseError("decimal exponent out of range: " + std::string(Raw));

  mpz_class Numerator(Coefficient, 10);
  if (Negative)
    Numerator = -Numerator;

  mpq_class Value;
  if (Scale >= 0) {
    mpz_class Scaled = Numerator * pow10(static_cast<unsigned long>(Scale));
    Value = mpq_class(Scaled);
  } else {
    Value = mpq_class(Numerator, pow10(static_cast<unsigned long>(-Scale)));
  }
  return ExactValue::finite(std::move(Value));
}

} // namespace floatrep

#endif // FLOATREP_TEXT_PARSE_HPP
