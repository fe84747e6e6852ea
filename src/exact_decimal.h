// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstdint>

namespace fpround {

// The nonnegative decimal number digits * 10^exponent.
//
// num_digits is the number of decimal digits of 'digits', i.e.
//  10^(num_digits - 1) <= digits < 10^num_digits   if digits != 0.
//
// The shortest decimal of +0 is {0, 0, 0}. After rounding to a precision, a
// zero result is always represented as {0, 0, 1}, i.e. a single '0' digit.
struct ExactDecimal
{
    uint64_t digits = 0;
    int32_t exponent = 0;
    int32_t num_digits = 0;
};

inline bool operator==(ExactDecimal const& lhs, ExactDecimal const& rhs)
{
    return lhs.digits == rhs.digits && lhs.exponent == rhs.exponent && lhs.num_digits == rhs.num_digits;
}

inline bool operator!=(ExactDecimal const& lhs, ExactDecimal const& rhs)
{
    return !(lhs == rhs);
}

} // namespace fpround
