// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "exact_decimal.h"

namespace fpround {
namespace schubfach {

// ExactDecimal dec = ShortestDecimal(value);
//
// Computes the decimal number f * 10^e with the least number of significant
// digits, which rounds back to 'value' when read in (using round-to-nearest-even).
// If there is more than one such number, the one closest to 'value' is
// returned, and if both are equally close, the one with the even significand.
//
// Note:
// The significand may carry trailing zeros, e.g. 123.45 is returned as
// 12345000000000000 * 10^-14. Subnormal numbers with a very small significand
// are returned with at least 2 digits, e.g. 4.9 * 10^-324 for the smallest
// positive double.
//
// PRE: value must be finite and strictly positive.
ExactDecimal ShortestDecimal(double value);
ExactDecimal ShortestDecimal(float value);

} // namespace schubfach
} // namespace fpround
