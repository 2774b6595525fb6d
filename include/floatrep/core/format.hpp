#ifndef FLOATREP_CORE_FORMAT_HPP
#define FLOATREP_CORE_FORMAT_HPP

#include <array>
#include <string>
#include <string_view>

#include "floatrep/core/errors.hpp"

namespace floatrep {

// Supported widths for user-specified formats. Presets are checked
// against the same limits at compile time.
inline constexpr int MinExpBits = 2;
inline constexpr int MaxExpBits = 11;
inline constexpr int MinMantBits = 1;
inline constexpr int MaxMantBits = 52;

constexpr bool isSupportedExpBits(int ExpBits) {
  return ExpBits >= MinExpBits && ExpBits <= MaxExpBits;
}

constexpr bool isSupportedMantBits(int MantBits) {
  return MantBits >= MinMantBits && MantBits <= MaxMantBits;
}

// Bit geometry of an IEEE 754-style binary format: [S][E][M], sign at the
// MSB, significand at the LSB. Says nothing about a particular value.
struct FormatDescriptor {
  std::string_view Name;
  int ExpBits;  // exponent field width
  int MantBits; // significand field width (stored fraction bits)

  constexpr int totalBits() const { return 1 + ExpBits + MantBits; }

  // 2^(E-1) - 1
  constexpr int bias() const { return (1 << (ExpBits - 1)) - 1; }

  // Exponent of the smallest normal; also the scale of subnormals.
  constexpr int minExponent() const { return 1 - bias(); }

  constexpr int maxExponent() const { return bias(); }

  // Exponent carried by infinities and NaN.
  constexpr int specialExponent() const { return maxExponent() + 1; }

  constexpr bool isSupported() const {
    return isSupportedExpBits(ExpBits) && isSupportedMantBits(MantBits);
  }

  friend constexpr bool operator==(const FormatDescriptor &A,
                                   const FormatDescriptor &B) {
    return A.ExpBits == B.ExpBits && A.MantBits == B.MantBits;
  }
};

// Compile-time layout, for presets and static checks.
template <int ExpBits, int MantBits> struct IEEE_Layout {
  static constexpr int exp_bits = ExpBits;
  static constexpr int mant_bits = MantBits;
  static constexpr int total_bits = 1 + ExpBits + MantBits;

  static_assert(isSupportedExpBits(ExpBits),
                "exponent width outside the supported range");
  static_assert(isSupportedMantBits(MantBits),
                "significand width outside the supported range");

  static constexpr FormatDescriptor describe(std::string_view Name) {
    return {Name, ExpBits, MantBits};
  }
};

using fp8_e5m2_layout = IEEE_Layout<5, 2>;
using fp8_e4m3_layout = IEEE_Layout<4, 3>;
using fp16_layout = IEEE_Layout<5, 10>;
using bfloat16_layout = IEEE_Layout<8, 7>;
using tf32_layout = IEEE_Layout<8, 10>;
using fp32_layout = IEEE_Layout<8, 23>;
using fp64_layout = IEEE_Layout<11, 52>;

namespace formats {

inline constexpr FormatDescriptor fp16 = fp16_layout::describe("FP16");
inline constexpr FormatDescriptor bfloat16 =
    bfloat16_layout::describe("bfloat16");
inline constexpr FormatDescriptor fp32 = fp32_layout::describe("FP32");
inline constexpr FormatDescriptor fp64 = fp64_layout::describe("FP64");
inline constexpr FormatDescriptor tf32 =
    tf32_layout::describe("TensorFloat-32");
// IEEE-style 8-bit layouts: the all-ones exponent is reserved for Inf/NaN.
inline constexpr FormatDescriptor fp8_e5m2 =
    fp8_e5m2_layout::describe("FP8-E5M2");
inline constexpr FormatDescriptor fp8_e4m3 =
    fp8_e4m3_layout::describe("FP8-E4M3");

struct Preset {
  std::string_view Key;
  FormatDescriptor Format;
};

inline constexpr std::array<Preset, 7> Presets{{
    {"fp16", fp16},
    {"bfloat16", bfloat16},
    {"fp32", fp32},
    {"fp64", fp64},
    {"tf32", tf32},
    {"fp8-e5m2", fp8_e5m2},
    {"fp8-e4m3", fp8_e4m3},
}};

} // namespace formats

// A user-specified layout. Throws ConfigError outside the supported widths.
inline FormatDescriptor customFormat(int ExpBits, int MantBits) {
  if (!isSupportedExpBits(ExpBits))
    throw ConfigError("exponent bits must be between " +
                      std::to_string(MinExpBits) + " and " +
                      std::to_string(MaxExpBits));
  if (!isSupportedMantBits(MantBits))
    throw ConfigError("significand bits must be between " +
                      std::to_string(MinMantBits) + " and " +
                      std::to_string(MaxMantBits));
  return {"Custom", ExpBits, MantBits};
}

} // namespace floatrep

#endif // FLOATREP_CORE_FORMAT_HPP
