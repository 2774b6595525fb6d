#ifndef FLOATREP_CORE_RATIONAL_HPP
#define FLOATREP_CORE_RATIONAL_HPP

// Exact-arithmetic helpers on GMP integers and rationals. Nothing in here
// touches binary floating point.

#include <gmp.h>
#include <gmpxx.h>

namespace floatrep {

// Number of significant bits; 0 for zero.
inline int bitLength(const mpz_class &Z) {
  if (Z == 0)
    return 0;
  return static_cast<int>(mpz_sizeinbase(Z.get_mpz_t(), 2));
}

// 2^Exp as an exact rational, for any sign of Exp.
inline mpq_class pow2(int Exp) {
  mpq_class R(1);
  if (Exp >= 0)
    mpq_mul_2exp(R.get_mpq_t(), R.get_mpq_t(), static_cast<mp_bitcnt_t>(Exp));
  else
    mpq_div_2exp(R.get_mpq_t(), R.get_mpq_t(), static_cast<mp_bitcnt_t>(-Exp));
  return R;
}

// 10^Exp as an integer.
inline mpz_class pow10(unsigned long Exp) {
  mpz_class Z;
  mpz_ui_pow_ui(Z.get_mpz_t(), 10, Exp);
  return Z;
}

// Sign of (R - 2^Exp) for a positive canonical rational R, computed by
// cross-multiplying instead of building 2^Exp as a rational.
inline int comparePow2(const mpq_class &R, int Exp) {
  mpz_class Lhs = R.get_num();
  mpz_class Rhs = R.get_den();
  if (Exp >= 0)
    mpz_mul_2exp(Rhs.get_mpz_t(), Rhs.get_mpz_t(),
                 static_cast<mp_bitcnt_t>(Exp));
  else
    mpz_mul_2exp(Lhs.get_mpz_t(), Lhs.get_mpz_t(),
                 static_cast<mp_bitcnt_t>(-Exp));
  int C = cmp(Lhs, Rhs);
  return (C > 0) - (C < 0);
}

// floor(log2(R)) for a positive rational R, exact. The bit lengths of
// numerator and denominator bound the answer to within one; the loop
// settles it so that 2^Exp <= R < 2^(Exp+1).
inline int floorLog2(const mpq_class &R) {
  int Exp = bitLength(R.get_num()) - bitLength(R.get_den());
  for (;;) {
    if (comparePow2(R, Exp) < 0) {
      --Exp;
      continue;
    }
    if (comparePow2(R, Exp + 1) >= 0) {
      ++Exp;
      continue;
    }
    return Exp;
  }
}

} // namespace floatrep

#endif // FLOATREP_CORE_RATIONAL_HPP
