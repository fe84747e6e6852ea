// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "precision.h"

#include "format_digits.h"

#include <algorithm>
#include <cstring>

using namespace fpround::impl;

//==================================================================================================
//
//==================================================================================================

static inline uint64_t Pow10(int32_t k)
{
    static constexpr uint64_t Pow10Table[] = {
        1ull,
        10ull,
        100ull,
        1000ull,
        10000ull,
        100000ull,
        1000000ull,
        10000000ull,
        100000000ull,
        1000000000ull,
        10000000000ull,
        100000000000ull,
        1000000000000ull,
        10000000000000ull,
        100000000000000ull,
        1000000000000000ull,
        10000000000000000ull,
        100000000000000000ull,
    };

    FPROUND_ASSERT(k >= 0);
    FPROUND_ASSERT(k <= 17);
    return Pow10Table[k];
}

void fpround::impl::RoundToDigits(ExactDecimal& dec, int64_t p, TrailingZeros mode)
{
    if (dec.num_digits == 0 || p < 0)
    {
        dec = {0, 0, 1};
        return;
    }

    if (p >= dec.num_digits)
    {
        return;
    }

    // 0 <= p < num_digits <= 17
    const int32_t d = dec.num_digits - static_cast<int32_t>(p);
    const uint64_t scale = Pow10(d);

    dec.exponent += d;
    dec.digits = (dec.digits + scale / 2) / scale;

    if (p == 0)
    {
        // digits is either 0 or 1.
        dec.num_digits = 1;
        if (dec.digits == 0)
        {
            dec.exponent = 0;
        }
        return;
    }

    dec.num_digits = static_cast<int32_t>(p);
    if (dec.digits == Pow10(dec.num_digits))
    {
        // Carry, e.g. 9.99 -> 10.0
        if (mode == TrailingZeros::consistent)
        {
            dec.num_digits += 1;
        }
        else
        {
            dec.digits /= 10;
            dec.exponent += 1;
        }
    }
}

std::string fpround::FormatPlain(ExactDecimal dec, int precision, TrailingZeros mode)
{
    FPROUND_ASSERT(precision >= 0);

    RoundToDigits(dec, int64_t{dec.num_digits} + dec.exponent + precision, mode);

    const int64_t num_digits = dec.num_digits;
    const int64_t exponent = dec.exponent;
    const int64_t decimal_point = num_digits + exponent;

    // Number of zeros to append after the significant digits in order to
    // print exactly 'precision' fractional digits.
    const int64_t extra = (mode == TrailingZeros::consistent) ? std::min<int64_t>(exponent, 0) + precision : 0;
    FPROUND_ASSERT(extra >= 0);

    std::string str;
    if (exponent >= 0)
    {
        // digits[000][.000]
        const int64_t length = decimal_point + (extra > 0 ? 1 + extra : 0);
        str.assign(static_cast<size_t>(length), '0');
        PrintDecimalDigits(&str[0], dec.digits, dec.num_digits);
        if (extra > 0)
        {
            str[static_cast<size_t>(decimal_point)] = '.';
        }
    }
    else if (decimal_point > 0)
    {
        // dig.its[000]
        const int64_t length = num_digits + 1 + extra;
        str.assign(static_cast<size_t>(length), '0');
        PrintDecimalDigits(&str[1], dec.digits, dec.num_digits);
        std::memmove(&str[0], &str[1], static_cast<size_t>(decimal_point));
        str[static_cast<size_t>(decimal_point)] = '.';
    }
    else
    {
        // 0.[000]digits[000]
        const int64_t length = 2 - decimal_point + num_digits + extra;
        str.assign(static_cast<size_t>(length), '0');
        str[1] = '.';
        PrintDecimalDigits(&str[static_cast<size_t>(2 - decimal_point)], dec.digits, dec.num_digits);
    }

    return str;
}
