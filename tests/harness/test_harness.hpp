#ifndef FLOATREP_TESTS_HARNESS_TEST_HARNESS_HPP
#define FLOATREP_TESTS_HARNESS_TEST_HARNESS_HPP

// Generic "this against that" test harness.
//
// testAgainst(Name, Iter, ImplA, ImplB, Cmp)
//   runs ImplA and ImplB on every input yielded by Iter, compares the
//   bit strings they return using Cmp, and prints results.
//
// Both ImplA and ImplB are opaque callables:
//   (const Input &) -> std::string   (a bit string for the format)
// The harness knows nothing about what library backs them.

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <random>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <gmpxx.h>

#include "floatrep/floatrep.hpp"

namespace floatrep::testing {

// ===================================================================
// Input printing
// ===================================================================

inline std::string inputText(const std::string &S) { return S; }
inline std::string inputText(const mpq_class &Q) { return Q.get_str(); }
inline std::string inputText(double D) {
  char Buf[64];
  std::snprintf(Buf, sizeof(Buf), "%.17g", D);
  return Buf;
}

// ===================================================================
// Failure record
// ===================================================================

template <typename Input> struct Failure {
  Input In;
  std::string OutputA;
  std::string OutputB;
};

struct TestResult {
  int Total = 0;
  int Passed = 0;
  int Failed = 0;
};

// ===================================================================
// testAgainst: the harness
// ===================================================================

static constexpr int MaxReportedFailures = 10;

template <typename Input, typename IterFn, typename ImplA, typename ImplB,
          typename Comparator>
TestResult testAgainst(const char *Name, IterFn Iter, ImplA A, ImplB B,
                       Comparator Cmp) {
  TestResult R;
  std::vector<Failure<Input>> Failures;

  Iter([&](const Input &In) {
    R.Total++;
    std::string OA = A(In);
    std::string OB = B(In);
    if (Cmp(OA, OB)) {
      R.Passed++;
    } else {
      R.Failed++;
      if (static_cast<int>(Failures.size()) < MaxReportedFailures)
        Failures.push_back({In, std::move(OA), std::move(OB)});
    }
  });

  std::printf("%s: %d/%d passed", Name, R.Passed, R.Total);
  if (R.Failed > 0)
    std::printf(" (%d FAILED)", R.Failed);
  std::printf("\n");

  for (const auto &F : Failures) {
    std::fprintf(stderr, "  FAIL %s: in=%s\n    implA=%s\n    implB=%s\n",
                 Name, inputText(F.In).c_str(), F.OutputA.c_str(),
                 F.OutputB.c_str());
  }

  return R;
}

// ===================================================================
// Iteration strategies
// ===================================================================

// Every value of a fixed list.
template <typename Input> struct TargetedValues {
  std::vector<Input> Values;

  template <typename Fn> void operator()(Fn &&Callback) const {
    for (const auto &V : Values)
      Callback(V);
  }
};

// Random signed dyadic rationals m * 2^k with m odd-or-even of up to
// MaxMantBits bits and k chosen so the magnitude's binade lies in
// [MinExp, MaxExp]. Exactly representable in a wide MPFR value.
struct RandomDyadics {
  uint64_t Seed;
  int Count;
  int MaxMantBits;
  int MinExp;
  int MaxExp;

  template <typename Fn> void operator()(Fn &&Callback) const {
    std::mt19937_64 Rng(Seed);
    std::uniform_int_distribution<int> WidthDist(1, MaxMantBits);
    std::uniform_int_distribution<int> ExpDist(MinExp, MaxExp);

    for (int I = 0; I < Count; ++I) {
      int Width = WidthDist(Rng);
      mpz_class M = 1; // leading one fixes the bit length
      for (int B = 1; B < Width; ++B)
        M = M * 2 + static_cast<unsigned long>(Rng() & 1);
      int Binade = ExpDist(Rng);
      mpq_class V = mpq_class(M) * pow2(Binade - (Width - 1));
      if (Rng() & 1)
        V = -V;
      Callback(V);
    }
  }
};

// Random decimal strings "[-]d.ddd...e[+-]N" with a non-zero leading digit.
struct RandomDecimals {
  uint64_t Seed;
  int Count;
  int MaxDigits;
  int MinExp10;
  int MaxExp10;

  template <typename Fn> void operator()(Fn &&Callback) const {
    std::mt19937_64 Rng(Seed);
    std::uniform_int_distribution<int> LenDist(1, MaxDigits);
    std::uniform_int_distribution<int> DigitDist(0, 9);
    std::uniform_int_distribution<int> LeadDist(1, 9);
    std::uniform_int_distribution<int> ExpDist(MinExp10, MaxExp10);

    for (int I = 0; I < Count; ++I) {
      std::string S;
      if (Rng() & 1)
        S += '-';
      S += static_cast<char>('0' + LeadDist(Rng));
      int Len = LenDist(Rng);
      if (Len > 1) {
        S += '.';
        for (int D = 1; D < Len; ++D)
          S += static_cast<char>('0' + DigitDist(Rng));
      }
      S += 'e';
      S += std::to_string(ExpDist(Rng));
      Callback(S);
    }
  }
};

// Random finite doubles from uniformly random bit patterns, with a share
// squeezed into [2^MinExp, 2^MaxExp) so narrow formats see more than
// overflow and zero.
struct RandomDoubles {
  uint64_t Seed;
  int Count;
  int MinExp;
  int MaxExp;

  template <typename Fn> void operator()(Fn &&Callback) const {
    std::mt19937_64 Rng(Seed);
    std::uniform_int_distribution<int> ExpDist(MinExp, MaxExp - 1);
    for (int I = 0; I < Count;) {
      uint64_t Bits = Rng();
      if (I % 2 == 1) {
        // Replace the exponent field with one inside the window.
        uint64_t Biased = static_cast<uint64_t>(ExpDist(Rng) + 1023);
        Bits = (Bits & ~(uint64_t{0x7FF} << 52)) | (Biased << 52);
      }
      double D;
      std::memcpy(&D, &Bits, sizeof(D));
      if (!std::isfinite(D))
        continue;
      ++I;
      Callback(D);
    }
  }
};

// Run multiple strategies in sequence.
template <typename... Strategies> struct Combined {
  std::tuple<Strategies...> Strats;

  template <typename Fn> void operator()(Fn &&Callback) const {
    std::apply([&](const auto &...S) { (S(Callback), ...); }, Strats);
  }
};

template <typename... Strategies>
Combined<Strategies...> combined(Strategies... S) {
  return {std::tuple{std::move(S)...}};
}

// ===================================================================
// Comparators
// ===================================================================

struct BitExact {
  bool operator()(const std::string &A, const std::string &B) const {
    return A == B;
  }
};

// NaN-aware comparison: if both outputs are NaN (regardless of payload
// and sign), they match. Otherwise bit-exact.
struct NanAwareBitExact {
  FormatDescriptor Fmt;

  bool isNan(const std::string &Bits) const {
    if (static_cast<int>(Bits.size()) != Fmt.totalBits())
      return false;
    std::string Exp = Bits.substr(1, Fmt.ExpBits);
    std::string Mant = Bits.substr(1 + Fmt.ExpBits);
    return Exp.find('0') == std::string::npos &&
           Mant.find('1') != std::string::npos;
  }

  bool operator()(const std::string &A, const std::string &B) const {
    if (isNan(A) && isNan(B))
      return true;
    return A == B;
  }
};

// ===================================================================
// Interesting values generators
// ===================================================================

// V in binary, zero-padded to Width characters.
inline std::string patternField(const mpz_class &V, int Width) {
  std::string D = V == 0 ? std::string() : V.get_str(2);
  return std::string(Width - static_cast<int>(D.size()), '0') + D;
}

namespace detail {

inline std::string pattern(bool Sign, const mpz_class &Exp,
                           const mpz_class &Mant, const FormatDescriptor &F) {
  return std::string(Sign ? "1" : "0") + patternField(Exp, F.ExpBits) +
         patternField(Mant, F.MantBits);
}

} // namespace detail

// Edge-case bit patterns, built from the format parameters alone.
inline std::vector<std::string> interestingValues(const FormatDescriptor &F) {
  const int M = F.MantBits;
  const mpz_class ExpMax = (mpz_class(1) << F.ExpBits) - 1;
  const mpz_class MantMask = (mpz_class(1) << M) - 1;
  const mpz_class Bias = F.bias();
  const mpz_class Quiet = mpz_class(1) << (M - 1);
  using detail::pattern;

  std::vector<std::string> V = {
      pattern(false, 0, 0, F),                 // +0
      pattern(true, 0, 0, F),                  // -0
      pattern(false, ExpMax, 0, F),            // +Inf
      pattern(true, ExpMax, 0, F),             // -Inf
      pattern(false, ExpMax, Quiet, F),        // QNaN
      pattern(false, ExpMax, 1, F),            // NaN, minimal payload
      pattern(true, ExpMax, MantMask, F),      // -NaN, all-ones payload
      pattern(false, 0, 1, F),                 // min +subnormal
      pattern(true, 0, 1, F),                  // min -subnormal
      pattern(false, 0, MantMask, F),          // max subnormal
      pattern(false, 1, 0, F),                 // min +normal
      pattern(false, ExpMax - 1, MantMask, F), // max +finite
      pattern(true, ExpMax - 1, MantMask, F),  // max -finite
      pattern(false, Bias, 0, F),              // 1.0
      pattern(true, Bias, 0, F),               // -1.0
      pattern(false, Bias, 1, F),              // 1.0 + 1 ULP
      pattern(false, 1, 1, F),                 // min normal + 1 ULP
  };
  if (F.ExpBits > 2) {
    V.push_back(pattern(false, Bias + 1, 0, F)); // 2.0
    V.push_back(pattern(false, Bias - 1, 0, F)); // 0.5
    V.push_back(pattern(false, Bias - 1, MantMask, F)); // 1.0 - 1 ULP
  }
  return V;
}

// Edge-case magnitudes around the boundaries of the format, as exact
// rationals: each boundary, and a hair either side of the halfway points.
inline std::vector<mpq_class>
interestingRationals(const FormatDescriptor &F) {
  const int M = F.MantBits;
  const int EMin = F.minExponent();
  const int EMax = F.maxExponent();
  const mpq_class Ulp1 = pow2(-M);                 // ULP of [1, 2)
  const mpq_class MinSub = pow2(EMin - M);         // smallest subnormal
  const mpq_class MinNorm = pow2(EMin);            // smallest normal
  const mpq_class MaxFinite = (2 - Ulp1) * pow2(EMax);
  const mpq_class Tiny = pow2(EMin - M - 12);

  std::vector<mpq_class> Base = {
      mpq_class(1),
      1 + Ulp1 / 2,               // tie, even below
      1 + Ulp1 + Ulp1 / 2,        // tie, odd below
      1 + Ulp1 / 2 + Tiny,        // just above tie
      1 + Ulp1 / 2 - Tiny,        // just below tie
      2 - Ulp1 / 2,               // tie that carries into the exponent
      2 - Ulp1 / 4,
      MinSub,
      MinSub / 2,                 // tie with zero
      MinSub / 2 + Tiny,
      MinSub * 3 / 2,             // tie, odd below
      MinNorm,
      MinNorm - MinSub / 2,       // rounds up into the normal range
      MinNorm - MinSub,           // max subnormal
      MaxFinite,
      MaxFinite + MaxFinite * Ulp1 / 4,
      MaxFinite + pow2(EMax - M - 1), // tie at overflow
      pow2(EMax + 1),                 // overflow before rounding
      pow2(EMax + 1) - Tiny,
      mpq_class(1) / 3,
      mpq_class(1) / 10,
      mpq_class(2) / 3 * MinNorm,
  };

  std::vector<mpq_class> Out;
  for (const auto &B : Base) {
    mpq_class P = B;
    P.canonicalize();
    if (P <= 0)
      continue;
    Out.push_back(P);
    Out.push_back(-P);
  }
  return Out;
}

} // namespace floatrep::testing

#endif // FLOATREP_TESTS_HARNESS_TEST_HARNESS_HPP
