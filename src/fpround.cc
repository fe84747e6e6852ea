// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "fpround.h"

#include "format_digits.h"
#include "ieee.h"
#include "schubfach.h"

#include <double-conversion/double-conversion.h>

#include <cassert>
#include <cmath>
#include <cstring>

#ifndef FPROUND_ASSERT
#define FPROUND_ASSERT(X) assert(X)
#endif

//==================================================================================================
// Dtoa
//==================================================================================================

template <typename Float>
static inline char* ToChars(char* buffer, Float value)
{
    const fpround::IEEE<Float> v(value);

    if (v.IsFinite()) // [[likely]]
    {
        buffer[0] = '-';
        buffer += v.SignBit();

        if (!v.IsZero()) // [[likely]]
        {
            const auto dec = fpround::schubfach::ShortestDecimal(v.AbsValue());
            return fpround::FormatDigits(buffer, dec.digits, dec.exponent);
        }

        std::memcpy(buffer, "0.0", 3);
        return buffer + 3;
    }

    if (v.IsNaN())
    {
        std::memcpy(buffer, "NaN", 3);
        return buffer + 3;
    }

    buffer[0] = '-';
    buffer += v.SignBit();

    std::memcpy(buffer, "Infinity", 8);
    return buffer + 8;
}

char* fpround::Dtoa(char* buffer, double value)
{
    return ToChars(buffer, value);
}

char* fpround::Ftoa(char* buffer, float value)
{
    return ToChars(buffer, value);
}

std::string fpround::ToString(double value)
{
    char buf[DtoaMinBufferLength];
    char* const end = Dtoa(buf, value);
    return std::string(buf, end);
}

std::string fpround::ToString(float value)
{
    char buf[FtoaMinBufferLength];
    char* const end = Ftoa(buf, value);
    return std::string(buf, end);
}

//==================================================================================================
// Split
//==================================================================================================

template <typename Float>
static inline fpround::ExactDecimal SplitImpl(Float value)
{
    const fpround::IEEE<Float> v(value);
    FPROUND_ASSERT(v.IsFinite());
    FPROUND_ASSERT(!v.SignBit() || v.IsZero());

    if (v.IsZero())
    {
        return {0, 0, 0};
    }

    return fpround::schubfach::ShortestDecimal(value);
}

fpround::ExactDecimal fpround::Split(double value)
{
    return SplitImpl(value);
}

fpround::ExactDecimal fpround::Split(float value)
{
    return SplitImpl(value);
}

//==================================================================================================
// Format
//==================================================================================================

std::string fpround::Format(double value, int precision, TrailingZeros mode)
{
    const IEEE<double> v(value);

    if (precision < 0 || !v.IsFinite())
    {
        return ToString(value);
    }

    std::string str = FormatPlain(Split(v.AbsValue()), precision, mode);
    if (v.SignBit())
    {
        str.insert(str.begin(), '-');
    }

    return str;
}

//==================================================================================================
// Round
//==================================================================================================

static const double_conversion::StringToDoubleConverter& Converter()
{
    static const double_conversion::StringToDoubleConverter conv(
        double_conversion::StringToDoubleConverter::NO_FLAGS, 0.0, 0.0, "Infinity", "NaN");
    return conv;
}

// Returns true if rounding value to 'precision' fractional digits would not
// change its shortest decimal representation.
template <typename Float>
static inline bool HasAtMostPrecisionDigits(Float value, int precision)
{
    const fpround::ExactDecimal dec = fpround::Split(std::fabs(static_cast<double>(value)));
    return int64_t{dec.exponent} + precision >= 0;
}

double fpround::Round(double value, int precision)
{
    if (precision < 0 || !std::isfinite(value))
    {
        return value;
    }

    if (HasAtMostPrecisionDigits(value, precision))
    {
        return value;
    }

    const std::string str = Format(value, precision);
    const int length = static_cast<int>(str.size());

    int processed_characters_count = 0;
    const double result = Converter().StringToDouble(str.data(), length, &processed_characters_count);
    FPROUND_ASSERT(processed_characters_count == length);
    static_cast<void>(processed_characters_count);

    return result;
}

float fpround::Round(float value, int precision)
{
    if (precision < 0 || !std::isfinite(value))
    {
        return value;
    }

    if (HasAtMostPrecisionDigits(value, precision))
    {
        return value;
    }

    const std::string str = Format(static_cast<double>(value), precision);
    const int length = static_cast<int>(str.size());

    int processed_characters_count = 0;
    const float result = Converter().StringToFloat(str.data(), length, &processed_characters_count);
    FPROUND_ASSERT(processed_characters_count == length);
    static_cast<void>(processed_characters_count);

    return result;
}
