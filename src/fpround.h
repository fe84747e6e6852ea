// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "exact_decimal.h"
#include "precision.h"

#include <string>

namespace fpround {

// char* output_end = Dtoa(buffer, value);
//
// Converts the given double-precision number into decimal form and stores the result in the given
// buffer.
//
// The buffer must be large enough, i.e. >= DtoaMinBufferLength.
// The output format is the same as Java's Double.toString:
//  - fixed notation for 10^-3 <= |value| < 10^7, e.g. "0.001", "123.45", "9999999.0"
//  - scientific notation otherwise, e.g. "1.0E7", "-4.9E-324", "1.7976931348623157E308"
//  - "0.0", "-0.0", "Infinity", "-Infinity" and "NaN" for the special values.
// The output is _not_ null-terminted.
//
// The output is optimal, i.e. the output string
//  1. rounds back to the input number when read in (using round-to-nearest-even)
//  2. is as short as possible,
//  3. is as close to the input number as possible.
//
// Note:
// This function may temporarily write up to DtoaMinBufferLength characters into the buffer.

constexpr int DtoaMinBufferLength = 32;

char* Dtoa(char* buffer, double value);

// char* output_end = Ftoa(buffer, value);
//
// Single-precision version of Dtoa.

constexpr int FtoaMinBufferLength = 32;

char* Ftoa(char* buffer, float value);

// Returns the shortest decimal representation of value as a string.
// See Dtoa.
std::string ToString(double value);
std::string ToString(float value);

// Returns the exact decimal record of the shortest decimal representation of value.
// Returns {0, 0, 0} for +0.
//
// PRE: value must be finite and >= 0.
ExactDecimal Split(double value);
ExactDecimal Split(float value);

// std::string str = Format(value, precision);
//
// Rounds the shortest decimal representation of value half-up (away from zero) to 'precision'
// fractional digits and returns the result in plain notation, e.g. Format(295.335, 2) == "295.34".
// The sign of negative values is always kept, e.g. Format(-0.001, 2) == "-0.00".
//
// If precision < 0, or if value is NaN or infinite, returns ToString(value).
std::string Format(double value, int precision, TrailingZeros mode = TrailingZeros::consistent);

// double rounded = Round(value, precision);
//
// Returns the double-precision number nearest to Format(value, precision).
// If precision < 0, or if value is NaN or infinite, returns value.
double Round(double value, int precision);

// Returns the single-precision number nearest to Format(double(value), precision).
float Round(float value, int precision);

} // namespace fpround
