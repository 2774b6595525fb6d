#ifndef FLOATREP_TEXT_FORMAT_RATIONAL_HPP
#define FLOATREP_TEXT_FORMAT_RATIONAL_HPP

// Exact rational -> decimal text. Digits are produced by long division, so
// the output is a truncation (never a rounding) of the exact value.

#include <cstddef>
#include <string>
#include <string_view>

#include <gmp.h>
#include <gmpxx.h>

#include "floatrep/core/enums.hpp"

namespace floatrep {

// Re-express a plain unsigned decimal ("123.45", "0.00123") as d.ddd...e+-N.
// Trailing zeros of the mantissa are dropped. A string with no non-zero
// digit renders as "0".
inline std::string toScientific(std::string_view Plain) {
  std::size_t Dot = Plain.find('.');
  std::size_t IntDigits = Dot == std::string_view::npos ? Plain.size() : Dot;

  std::string Digits;
  Digits.reserve(Plain.size());
  for (char C : Plain)
    if (C != '.')
      Digits += C;

  std::size_t Lead = Digits.find_first_not_of('0');
  if (Lead == std::string::npos)
    return "0";
  long Exponent = static_cast<long>(IntDigits) - 1 - static_cast<long>(Lead);

  std::string Rest = Digits.substr(Lead + 1);
  std::size_t LastNonZero = Rest.find_last_not_of('0');
  Rest.erase(LastNonZero == std::string::npos ? 0 : LastNonZero + 1);

  std::string Out(1, Digits[Lead]);
  if (!Rest.empty())
    Out += "." + Rest;
  Out += Exponent < 0 ? "e-" : "e+";
  Out += std::to_string(Exponent < 0 ? -Exponent : Exponent);
  return Out;
}

// Integer part by exact division, then at most Precision fraction digits,
// stopping early once the remainder is exactly zero.
inline std::string formatRational(const mpq_class &Value, std::size_t Precision,
                                  Notation Style = Notation::Plain) {
  if (Value == 0)
    return "0";

  bool Negative = sgn(Value) < 0;
  mpz_class Num = abs(Value.get_num());
  const mpz_class &Den = Value.get_den();

  mpz_class Integer, Remainder;
  mpz_tdiv_qr(Integer.get_mpz_t(), Remainder.get_mpz_t(), Num.get_mpz_t(),
              Den.get_mpz_t());

  std::string Repr = Integer.get_str();
  if (Remainder != 0 && Precision > 0) {
    Repr += '.';
    mpz_class Digit;
    for (std::size_t I = 0; I < Precision && Remainder != 0; ++I) {
      Remainder *= 10;
      mpz_tdiv_qr(Digit.get_mpz_t(), Remainder.get_mpz_t(),
                  Remainder.get_mpz_t(), Den.get_mpz_t());
      Repr += static_cast<char>('0' + Digit.get_ui());
    }
  }

  if (Style == Notation::Scientific)
    Repr = toScientific(Repr);
  if (Repr == "0")
    return Repr;
  return Negative ? "-" + Repr : Repr;
}

} // namespace floatrep

#endif // FLOATREP_TEXT_FORMAT_RATIONAL_HPP
