#ifndef FLOATREP_CONVERT_HPP
#define FLOATREP_CONVERT_HPP

// One input through the whole pipeline:
//
//   decimal -> parseDecimal -> quantize -> encodeBits/bitsToHex
//   bits    -> decodeBits  -------------> encodeBits/bitsToHex
//   hex     -> hexToBits -> decodeBits -> encodeBits/bitsToHex
//
// plus the exact value held by the encoding and, for decimal input, the
// difference from the source value.

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <gmpxx.h>

#include "floatrep/codec/bits.hpp"
#include "floatrep/codec/hex.hpp"
#include "floatrep/config.hpp"
#include "floatrep/core/enums.hpp"
#include "floatrep/core/float.hpp"
#include "floatrep/core/quantize.hpp"
#include "floatrep/core/value.hpp"
#include "floatrep/text/format_rational.hpp"
#include "floatrep/text/parse.hpp"

namespace floatrep {

struct Conversion {
  ClassifiedFloat Value;
  std::string Bits; // canonical, exactly totalBits() characters
  std::string Hex;
  std::optional<mpq_class> Stored; // empty for Inf/NaN
  std::optional<mpq_class> Source; // finite decimal input only

  // Stored - Source; empty unless both exist.
  std::optional<mpq_class> error() const {
    if (!Stored || !Source)
      return std::nullopt;
    mpq_class Diff = *Stored - *Source;
    return Diff;
  }
};

namespace detail {

inline Conversion finishConversion(ClassifiedFloat Value,
                                   const FormatDescriptor &Fmt) {
  Conversion C;
  C.Bits = encodeBits(Value, Fmt);
  C.Hex = bitsToHex(C.Bits);
  C.Stored = toRational(Value, Fmt);
  C.Value = std::move(Value);
  return C;
}

} // namespace detail

inline Conversion convertDecimal(std::string_view Text, const Options &Opts) {
  ExactValue Parsed = parseDecimal(Text);
  Conversion C = detail::finishConversion(
      quantize(Parsed, Opts.Format, Opts.Rounding), Opts.Format);
  if (const mpq_class *R = Parsed.rational())
    C.Source = *R;
  return C;
}

inline Conversion convertBits(std::string_view Text, const Options &Opts) {
  return detail::finishConversion(decodeBits(Text, Opts.Format), Opts.Format);
}

inline Conversion convertHex(std::string_view Text, const Options &Opts) {
  return detail::finishConversion(decodeHex(Text, Opts.Format, Opts.Hex),
                                  Opts.Format);
}

// Field-by-field report, one "Label       : value" line each.
inline std::string describe(const Conversion &C, const Options &Opts) {
  const FormatDescriptor &Fmt = Opts.Format;
  std::string Out;
  auto Line = [&Out](const char *Label, const std::string &Value) {
    Out += Label;
    Out += ": ";
    Out += Value;
    Out += '\n';
  };

  Line("Format      ", std::string(Fmt.Name));
  Line("Layout      ", "1 sign | " + std::to_string(Fmt.ExpBits) +
                           " exponent | " + std::to_string(Fmt.MantBits) +
                           " significand");
  Line("Class       ", className(C.Value.Class));
  Line("Sign        ", C.Value.Sign ? "-" : "+");
  Line("Exponent    ", std::to_string(C.Value.Exponent));
  Line("Binary      ", C.Bits);
  Line("Hex         ", C.Hex);

  if (C.Stored) {
    Line("Stored      ", formatRational(*C.Stored, Opts.Precision, Opts.Style));
    if (std::optional<mpq_class> Err = C.error())
      Line("Error       ", formatRational(*Err, Opts.Precision, Opts.Style));
  } else {
    Line("Stored      ", className(C.Value.Class));
    if (C.Source)
      Line("Error       ", "(undefined for NaN/Infinity)");
  }
  return Out;
}

} // namespace floatrep

#endif // FLOATREP_CONVERT_HPP
