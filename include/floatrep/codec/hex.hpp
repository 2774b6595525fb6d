#ifndef FLOATREP_CODEC_HEX_HPP
#define FLOATREP_CODEC_HEX_HPP

// Bit string <-> hexadecimal text.
//
// Display form drops leading zero digits, so the reverse direction always
// pads back to the format's width instead of trusting the digit count.

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

#include "floatrep/codec/bits.hpp"
#include "floatrep/core/enums.hpp"
#include "floatrep/core/errors.hpp"
#include "floatrep/core/float.hpp"
#include "floatrep/core/format.hpp"
#include "floatrep/text/strings.hpp"

namespace floatrep {

// Nibbles from the MSB end (left-padded to a multiple of 4), uppercase,
// leading zeros stripped. An all-zero string renders as "0".
inline std::string bitsToHex(std::string_view Bits) {
  std::size_t Pad = (4 - Bits.size() % 4) % 4;
  std::string Padded(Pad, '0');
  Padded += Bits;

  std::string Hex;
  Hex.reserve(Padded.size() / 4);
  for (std::size_t I = 0; I < Padded.size(); I += 4) {
    int Nibble = 0;
    for (std::size_t J = I; J < I + 4; ++J) {
      if (Padded[J] != '0' && Padded[J] != '1')
        throw FormatError("bits must contain only 0 or 1");
      Nibble = Nibble * 2 + (Padded[J] - '0');
    }
    if (Hex.empty() && Nibble == 0)
      continue;
    Hex += "0123456789ABCDEF"[Nibble];
  }
  if (Hex.empty())
    Hex = "0";
  return Hex;
}

// Hex text to exactly TotalBits bits. Accepts surrounding whitespace and an
// optional 0x/0X prefix; pads short input with zero nibbles. Input wider
// than TotalBits keeps the least-significant bits under HexPolicy::Lenient
// and is a FormatError under HexPolicy::Strict.
inline std::string hexToBits(std::string_view Text, int TotalBits,
                             HexPolicy Policy = HexPolicy::Lenient) {
  std::string_view Digits = stripRadixPrefix(trimSpace(Text), 'x');
  if (Digits.empty())
    throw FormatError("hex input has no digits");

  std::string Bits;
  Bits.reserve(Digits.size() * 4);
  for (char C : Digits) {
    if (!std::isxdigit(static_cast<unsigned char>(C)))
      throw FormatError(std::string("invalid hex digit: ") + C);
    int Val = std::isdigit(static_cast<unsigned char>(C))
                  ? C - '0'
                  : std::toupper(static_cast<unsigned char>(C)) - 'A' + 10;
    for (int Shift = 3; Shift >= 0; --Shift)
      Bits += ((Val >> Shift) & 1) ? '1' : '0';
  }

  const auto Total = static_cast<std::size_t>(TotalBits);
  const std::size_t ExpectedDigits = (Total + 3) / 4;
  if (Bits.size() < Total)
    return std::string(Total - Bits.size(), '0') + Bits;

  std::string_view Surplus(Bits.data(), Bits.size() - Total);
  if (Policy == HexPolicy::Strict) {
    if (Digits.size() > ExpectedDigits)
      throw FormatError("hex length (" + std::to_string(Digits.size()) +
                        ") does not match expected bits " +
                        std::to_string(Total));
    if (Surplus.find('1') != std::string_view::npos)
      throw FormatError("hex value does not fit in " + std::to_string(Total) +
                        " bits");
  }
  return Bits.substr(Bits.size() - Total);
}

inline std::string encodeHex(const ClassifiedFloat &F,
                             const FormatDescriptor &Fmt) {
  return bitsToHex(encodeBits(F, Fmt));
}

inline ClassifiedFloat decodeHex(std::string_view Text,
                                 const FormatDescriptor &Fmt,
                                 HexPolicy Policy = HexPolicy::Lenient) {
  return decodeBits(hexToBits(Text, Fmt.totalBits(), Policy), Fmt);
}

} // namespace floatrep

#endif // FLOATREP_CODEC_HEX_HPP
