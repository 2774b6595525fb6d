#ifndef FLOATREP_HPP
#define FLOATREP_HPP

#include "floatrep/codec/bits.hpp"
#include "floatrep/codec/hex.hpp"
#include "floatrep/config.hpp"
#include "floatrep/convert.hpp"
#include "floatrep/core/enums.hpp"
#include "floatrep/core/errors.hpp"
#include "floatrep/core/float.hpp"
#include "floatrep/core/format.hpp"
#include "floatrep/core/quantize.hpp"
#include "floatrep/core/rational.hpp"
#include "floatrep/core/rounding.hpp"
#include "floatrep/core/value.hpp"
#include "floatrep/text/format_rational.hpp"
#include "floatrep/text/parse.hpp"
#include "floatrep/text/strings.hpp"

#endif // FLOATREP_HPP
