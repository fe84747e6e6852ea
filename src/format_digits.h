// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cassert>
#include <cstdint>
#include <cstring>

#ifndef FPROUND_ASSERT
#define FPROUND_ASSERT(X) assert(X)
#endif

namespace fpround {
namespace impl {

inline char* Utoa_2Digits(char* buf, uint32_t digits)
{
    static constexpr char Digits100[200] = {
        '0','0','0','1','0','2','0','3','0','4','0','5','0','6','0','7','0','8','0','9',
        '1','0','1','1','1','2','1','3','1','4','1','5','1','6','1','7','1','8','1','9',
        '2','0','2','1','2','2','2','3','2','4','2','5','2','6','2','7','2','8','2','9',
        '3','0','3','1','3','2','3','3','3','4','3','5','3','6','3','7','3','8','3','9',
        '4','0','4','1','4','2','4','3','4','4','4','5','4','6','4','7','4','8','4','9',
        '5','0','5','1','5','2','5','3','5','4','5','5','5','6','5','7','5','8','5','9',
        '6','0','6','1','6','2','6','3','6','4','6','5','6','6','6','7','6','8','6','9',
        '7','0','7','1','7','2','7','3','7','4','7','5','7','6','7','7','7','8','7','9',
        '8','0','8','1','8','2','8','3','8','4','8','5','8','6','8','7','8','8','8','9',
        '9','0','9','1','9','2','9','3','9','4','9','5','9','6','9','7','9','8','9','9',
    };

    FPROUND_ASSERT(digits <= 99);
    std::memcpy(buf, &Digits100[2*digits], 2*sizeof(char));
    return buf + 2;
}

inline char* Utoa_4Digits(char* buf, uint32_t digits)
{
    FPROUND_ASSERT(digits <= 9999);
    const uint32_t q = digits / 100;
    const uint32_t r = digits % 100;
    Utoa_2Digits(buf + 0, q);
    Utoa_2Digits(buf + 2, r);
    return buf + 4;
}

inline char* Utoa_8Digits(char* buf, uint32_t digits)
{
    FPROUND_ASSERT(digits <= 99999999);
    const uint32_t q = digits / 10000;
    const uint32_t r = digits % 10000;
    Utoa_4Digits(buf + 0, q);
    Utoa_4Digits(buf + 4, r);
    return buf + 8;
}

// Returns the number of decimal digits of v.
// Returns 1 for v = 0.
inline int DecimalLength(uint64_t v)
{
    FPROUND_ASSERT(v <= 99999999999999999ull);

    if (v >= 10000000000000000ull) { return 17; }
    if (v >= 1000000000000000ull) { return 16; }
    if (v >= 100000000000000ull) { return 15; }
    if (v >= 10000000000000ull) { return 14; }
    if (v >= 1000000000000ull) { return 13; }
    if (v >= 100000000000ull) { return 12; }
    if (v >= 10000000000ull) { return 11; }
    if (v >= 1000000000ull) { return 10; }
    if (v >= 100000000ull) { return 9; }
    if (v >= 10000000ull) { return 8; }
    if (v >= 1000000ull) { return 7; }
    if (v >= 100000ull) { return 6; }
    if (v >= 10000ull) { return 5; }
    if (v >= 1000ull) { return 4; }
    if (v >= 100ull) { return 3; }
    if (v >= 10ull) { return 2; }
    return 1;
}

// Writes exactly output_length digits of output into buf.
// PRE: output_length == DecimalLength(output)
inline void PrintDecimalDigits(char* buf, uint64_t output, int output_length)
{
    // We prefer 32-bit operations, even on 64-bit platforms.
    // We have at most 17 digits, and uint32_t can store 9 digits.
    if (static_cast<uint32_t>(output >> 32) != 0)
    {
        FPROUND_ASSERT(output_length > 8);
        const uint64_t q = output / 100000000;
        const uint32_t r = static_cast<uint32_t>(output % 100000000);
        output = q;
        output_length -= 8;
        Utoa_8Digits(buf + output_length, r);
    }

    FPROUND_ASSERT(output <= UINT32_MAX);
    uint32_t output2 = static_cast<uint32_t>(output);

    while (output2 >= 10000)
    {
        FPROUND_ASSERT(output_length > 4);
        const uint32_t q = output2 / 10000;
        const uint32_t r = output2 % 10000;
        output2 = q;
        output_length -= 4;
        Utoa_4Digits(buf + output_length, r);
    }

    if (output2 >= 100)
    {
        FPROUND_ASSERT(output_length > 2);
        const uint32_t q = output2 / 100;
        const uint32_t r = output2 % 100;
        output2 = q;
        output_length -= 2;
        Utoa_2Digits(buf + output_length, r);
    }

    if (output2 >= 10)
    {
        FPROUND_ASSERT(output_length == 2);
        Utoa_2Digits(buf, output2);
    }
    else
    {
        FPROUND_ASSERT(output_length == 1);
        buf[0] = static_cast<char>('0' + output2);
    }
}

// Writes a decimal exponent 0 <= k <= 999 without leading zeros.
inline char* PrintExponent(char* buf, uint32_t k)
{
    FPROUND_ASSERT(k <= 999);

    if (k < 10)
    {
        *buf++ = static_cast<char>('0' + k);
    }
    else if (k < 100)
    {
        buf = Utoa_2Digits(buf, k);
    }
    else
    {
        const uint32_t r = k % 10;
        const uint32_t q = k / 10;
        buf = Utoa_2Digits(buf, q);
        *buf++ = static_cast<char>('0' + r);
    }

    return buf;
}

} // namespace impl

// Print digits * 10^decimal_exponent in the form used by Java's Double.toString:
//
//  1.0E-5    scientific, if the decimal point is left of the 3rd zero after the point
//  0.001     fixed
//  123.45    fixed
//  9999999.0 fixed, if the number has at most 7 integral digits
//  1.0E7     scientific otherwise
//
// Trailing zeros are removed, except the one directly after the decimal point.
// The output is _not_ null-terminated.
//
// PRE: sizeof(buffer) >= 25
// PRE: 0 < digits <= 99999999999999999
// PRE: abs(decimal_exponent) <= 999
char* FormatDigits(char* buffer, uint64_t digits, int32_t decimal_exponent);

} // namespace fpround
