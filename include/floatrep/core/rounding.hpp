#ifndef FLOATREP_CORE_ROUNDING_HPP
#define FLOATREP_CORE_ROUNDING_HPP

#include <gmp.h>
#include <gmpxx.h>

#include "floatrep/core/enums.hpp"
#include "floatrep/core/rational.hpp"

namespace floatrep {

// Bits extracted beyond the significand before rounding: Guard, Round and
// one more that is folded into Sticky.
inline constexpr int ExtraBits = 3;

// The first Width bits after the binary point of a fraction in [0, 1),
// most significant first, plus whether anything non-zero lies beyond.
struct FractionBits {
  mpz_class Bits; // Width bits, MSB = first bit after the point
  int Width = 0;
  bool Sticky = false;
};

// Equivalent to Width rounds of "double the remainder, emit the integer
// part", done with one exact division.
inline FractionBits extractFractionBits(const mpq_class &Fraction, int Width) {
  FractionBits Out;
  Out.Width = Width;
  mpz_class Scaled = Fraction.get_num();
  mpz_mul_2exp(Scaled.get_mpz_t(), Scaled.get_mpz_t(),
               static_cast<mp_bitcnt_t>(Width));
  mpz_class Remainder;
  mpz_fdiv_qr(Out.Bits.get_mpz_t(), Remainder.get_mpz_t(), Scaled.get_mpz_t(),
              Fraction.get_den_mpz_t());
  Out.Sticky = Remainder != 0;
  return Out;
}

struct RoundedSignificand {
  mpz_class Value; // < 2^Width; zero when Carry is set
  bool Carry = false;
};

// Reduce extracted bits to Width bits. For HalfToEven the kept value is
// incremented when Guard is set and either Round/Sticky is set or the kept
// LSB is odd (exact tie). An increment past 2^Width - 1 reports Carry.
inline RoundedSignificand roundSignificand(const FractionBits &In, int Width,
                                           RoundingMode Mode) {
  RoundedSignificand Out;
  int Dropped = In.Width - Width;
  if (Dropped <= 0) {
    Out.Value = In.Bits;
    if (Dropped < 0)
      mpz_mul_2exp(Out.Value.get_mpz_t(), Out.Value.get_mpz_t(),
                   static_cast<mp_bitcnt_t>(-Dropped));
    return Out;
  }

  mpz_class Kept = In.Bits;
  mpz_fdiv_q_2exp(Kept.get_mpz_t(), Kept.get_mpz_t(),
                  static_cast<mp_bitcnt_t>(Dropped));

  if (Mode == RoundingMode::TowardZero) {
    Out.Value = Kept;
    return Out;
  }

  const mpz_srcptr Raw = In.Bits.get_mpz_t();
  bool Guard = mpz_tstbit(Raw, static_cast<mp_bitcnt_t>(Dropped - 1)) != 0;
  bool Round =
      Dropped >= 2 && mpz_tstbit(Raw, static_cast<mp_bitcnt_t>(Dropped - 2));
  bool Sticky = In.Sticky;
  for (int I = Dropped - 3; I >= 0 && !Sticky; --I)
    Sticky = mpz_tstbit(Raw, static_cast<mp_bitcnt_t>(I)) != 0;
  bool Odd = mpz_odd_p(Kept.get_mpz_t()) != 0;

  if (Guard && (Round || Sticky || Odd)) {
    ++Kept;
    if (bitLength(Kept) > Width) {
      Out.Carry = true;
      Kept = 0;
    }
  }
  Out.Value = Kept;
  return Out;
}

} // namespace floatrep

#endif // FLOATREP_CORE_ROUNDING_HPP
