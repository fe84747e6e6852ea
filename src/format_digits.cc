// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "format_digits.h"

using namespace fpround::impl;

//==================================================================================================
//
//==================================================================================================

// Numbers with a decimal point position in (MinExp, MaxExp] are printed in
// fixed notation.
static constexpr int32_t MinExp = -3;
static constexpr int32_t MaxExp =  7;

char* fpround::FormatDigits(char* buffer, uint64_t digits, int32_t decimal_exponent)
{
    FPROUND_ASSERT(digits != 0);
    FPROUND_ASSERT(digits <= 99999999999999999ull);
    FPROUND_ASSERT(decimal_exponent >= -999);
    FPROUND_ASSERT(decimal_exponent <=  999);

    while (digits % 10 == 0)
    {
        digits /= 10;
        ++decimal_exponent;
    }

    const int32_t num_digits = DecimalLength(digits);
    const int32_t decimal_point = num_digits + decimal_exponent;

    const bool use_fixed = MinExp < decimal_point && decimal_point <= MaxExp;

    // Prepare the buffer.
    // With the limits above, at most 24 characters are either '0's or digits.
    std::memset(buffer, '0', 24);

    if (use_fixed)
    {
        if (decimal_point <= 0)
        {
            // 0.[000]digits
            PrintDecimalDigits(buffer + 2 - decimal_point, digits, num_digits);
            buffer[1] = '.';
            return buffer + 2 - decimal_point + num_digits;
        }

        if (num_digits > decimal_point)
        {
            // dig.its
            PrintDecimalDigits(buffer + 1, digits, num_digits);
            std::memmove(buffer, buffer + 1, static_cast<unsigned>(decimal_point));
            buffer[decimal_point] = '.';
            return buffer + num_digits + 1;
        }

        // digits[000].0
        PrintDecimalDigits(buffer, digits, num_digits);
        buffer += decimal_point;
        *buffer++ = '.';
        *buffer++ = '0';
        return buffer;
    }

    // buffer = ?ddddd ==> d.dddd
    PrintDecimalDigits(buffer + 1, digits, num_digits);
    buffer[0] = buffer[1];
    buffer[1] = '.';
    // For a single digit, buffer[2] is one of the pre-filled '0's.
    buffer += (num_digits == 1) ? 3 : 1 + num_digits;

    int32_t scientific_exponent = decimal_point - 1;
    *buffer++ = 'E';
    if (scientific_exponent < 0)
    {
        scientific_exponent = -scientific_exponent;
        *buffer++ = '-';
    }

    return PrintExponent(buffer, static_cast<uint32_t>(scientific_exponent));
}
