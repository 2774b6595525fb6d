#ifndef FLOATREP_CONFIG_HPP
#define FLOATREP_CONFIG_HPP

// Runtime configuration: resolves user-facing names into a format, a
// rounding mode and a notation. All failures are ConfigError.

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "floatrep/core/enums.hpp"
#include "floatrep/core/errors.hpp"
#include "floatrep/core/format.hpp"
#include "floatrep/text/strings.hpp"

namespace floatrep {

struct Options {
  FormatDescriptor Format = formats::fp32;
  RoundingMode Rounding = RoundingMode::HalfToEven;
  std::size_t Precision = 32; // decimal digits after the point
  Notation Style = Notation::Plain;
  HexPolicy Hex = HexPolicy::Lenient;
};

inline FormatDescriptor formatByName(std::string_view Name) {
  std::string Key = toLower(trimSpace(Name));
  for (const auto &P : formats::Presets)
    if (P.Key == Key)
      return P.Format;
  throw ConfigError("unknown format: " + std::string(Name));
}

// A preset, or "custom" with both widths given.
inline FormatDescriptor resolveFormat(std::string_view Name,
                                      std::optional<int> ExpBits,
                                      std::optional<int> MantBits) {
  if (toLower(trimSpace(Name)) != "custom")
    return formatByName(Name);
  if (!ExpBits)
    throw ConfigError("exponent bits are required for a custom format");
  if (!MantBits)
    throw ConfigError("significand bits are required for a custom format");
  return customFormat(*ExpBits, *MantBits);
}

inline RoundingMode roundingModeByName(std::string_view Name) {
  std::string Key = toLower(trimSpace(Name));
  if (Key == "half-even" || Key == "nearest" || Key == "even")
    return RoundingMode::HalfToEven;
  if (Key == "toward-zero" || Key == "trunc" || Key == "zero")
    return RoundingMode::TowardZero;
  throw ConfigError("unknown rounding mode: " + std::string(Name));
}

inline Notation notationByName(std::string_view Name) {
  std::string Key = toLower(trimSpace(Name));
  if (Key == "plain")
    return Notation::Plain;
  if (Key == "scientific")
    return Notation::Scientific;
  throw ConfigError("unknown notation: " + std::string(Name));
}

} // namespace floatrep

#endif // FLOATREP_CONFIG_HPP
