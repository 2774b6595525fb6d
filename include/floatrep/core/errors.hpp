#ifndef FLOATREP_CORE_ERRORS_HPP
#define FLOATREP_CORE_ERRORS_HPP

// Typed failures. Every stage either returns a complete result or throws
// one of these before producing output; nothing is retried or recovered
// inside the library.

#include <stdexcept>
#include <string>

namespace floatrep {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Malformed decimal numeral, or a decimal exponent out of range.
class ParseError : public Error {
public:
  using Error::Error;
};

// Bit string of the wrong length or with non-binary characters; hex text
// that is empty, non-hex, or (strict policy) wider than the format.
class FormatError : public Error {
public:
  using Error::Error;
};

// Exponent/significand widths outside the supported range, or an unknown
// preset, rounding mode or notation name.
class ConfigError : public Error {
public:
  using Error::Error;
};

} // namespace floatrep

#endif // FLOATREP_CORE_ERRORS_HPP
