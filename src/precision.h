// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "exact_decimal.h"

#include <cstdint>
#include <string>

namespace fpround {

// Controls the number of fractional digits when rounding carries into a new
// leading digit, e.g. when 0.999 is rounded to 2 digits.
enum class TrailingZeros {
    // The number of fractional digits always equals the requested precision:
    // "1.00". Integral results are padded with zeros: 1.0 -> "1.00".
    consistent,
    // Behaves like java.util.Formatter: "1.0". Integral results are printed
    // without a decimal point: 1.0 -> "1".
    jdk,
};

namespace impl {

// Rounds dec half-up to p significant digits, i.e. to the digit at position
// 10^(dec.exponent + dec.num_digits - p).
// A result of zero is normalized to {0, 0, 1}.
void RoundToDigits(ExactDecimal& dec, int64_t p, TrailingZeros mode);

} // namespace impl

// Rounds dec half-up to 'precision' fractional digits and returns it in plain
// (non-scientific) notation.
//
// PRE: precision >= 0
std::string FormatPlain(ExactDecimal dec, int precision, TrailingZeros mode = TrailingZeros::consistent);

} // namespace fpround
