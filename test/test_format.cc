#include "../src/fpround.h"

#include <catch2/catch.hpp>

#include <double-conversion/double-conversion.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <random>
#include <string>

#include "test_util.h"

using fpround::TrailingZeros;

//==================================================================================================
//
//==================================================================================================

// Rounds the shortest representation of value half-up to 'precision' fractional digits, using
// string arithmetic on the digits generated by double-conversion.
static std::string ReferenceFormat(double value, int precision)
{
    using double_conversion::DoubleToStringConverter;

    char digits[DoubleToStringConverter::kBase10MaximalLength + 1];
    bool sign = false;
    int length = 0;
    int point = 0;
    DoubleToStringConverter::DoubleToAscii(value, DoubleToStringConverter::SHORTEST, 0, digits, static_cast<int>(sizeof(digits)), &sign, &length, &point);

    // value = 0.digits * 10^point
    // Collect all integral digits, 'precision' fractional digits and one more digit for rounding.
    const int int_length = std::max(point, 1);
    const int num = int_length + precision + 1;

    std::string str(static_cast<size_t>(num), '0');
    for (int j = 0; j < num; ++j)
    {
        const int i = j - (int_length - point);
        if (0 <= i && i < length)
            str[static_cast<size_t>(j)] = digits[i];
    }

    const bool round_up = str.back() >= '5';
    str.pop_back();

    if (round_up)
    {
        int j = static_cast<int>(str.size()) - 1;
        for ( ; j >= 0 && str[static_cast<size_t>(j)] == '9'; --j)
            str[static_cast<size_t>(j)] = '0';

        if (j >= 0)
            ++str[static_cast<size_t>(j)];
        else
            str.insert(str.begin(), '1');
    }

    if (precision > 0)
        str.insert(str.size() - static_cast<size_t>(precision), 1, '.');

    if (sign)
        str.insert(str.begin(), '-');

    return str;
}

static void CheckFormat(double value, int precision, const std::string& expected)
{
    CAPTURE(value);
    CAPTURE(precision);
    CHECK(fpround::Format(value, precision) == expected);
    CHECK(fpround::Format(value, precision, TrailingZeros::consistent) == expected);
}

static void CheckFormatJdk(double value, int precision, const std::string& expected)
{
    CAPTURE(value);
    CAPTURE(precision);
    CHECK(fpround::Format(value, precision, TrailingZeros::jdk) == expected);
}

static void CheckReference(double value, int precision)
{
    CAPTURE(value);
    CAPTURE(precision);
    CHECK(fpround::Format(value, precision) == ReferenceFormat(value, precision));
}

//==================================================================================================
//
//==================================================================================================

TEST_CASE("Format - Examples")
{
    CheckFormat(0.0, 2, "0.00");
    CheckFormat(1.5, 2, "1.50");
    CheckFormat(9.99, 1, "10.0");
    CheckFormat(295.335, 2, "295.34");
    CheckFormat(0.01, 1, "0.0");
    CheckFormat(-0.01, 1, "-0.0");
    CheckFormat(9223372036854.77, 3, "9223372036854.770");
    CheckFormat(-9223372036854.77, 3, "-9223372036854.770");
}

TEST_CASE("Format - Consistent trailing zeros")
{
    CheckFormat(0.0, 0, "0");
    CheckFormat(0.01, 3, "0.010");
    CheckFormat(0.5, 2, "0.50");
    CheckFormat(1.0, 2, "1.00");
    CheckFormat(0.001, 2, "0.00");
    CheckFormat(100.0, 2, "100.00");
    CheckFormat(99.99, 1, "100.0");
    CheckFormat(0.999, 2, "1.00");
    CheckFormat(0.9999999, 3, "1.000");
    CheckFormat(9999999999999.99, 1, "10000000000000.0");
    CheckFormat(10.001, 1, "10.0");
    CheckFormat(0.95, 1, "1.0");
    CheckFormat(0.96, 1, "1.0");
    CheckFormat(1e-5, 2, "0.00");
    CheckFormat(1e-5, 10, "0.0000100000");
    CheckFormat(123.456, 5, "123.45600");
    CheckFormat(12345.6789, 2, "12345.68");
    CheckFormat(0.1, 20, "0.10000000000000000000");
    CheckFormat(1e21, 2, "1000000000000000000000.00");
    CheckFormat(9007199254740992.0, 9, "9007199254740992.000000000");
    CheckFormat(9007199254740998.0, 20, "9007199254740998.00000000000000000000");
    CheckFormat(2305843009213694000.0, 6, "2305843009213694000.000000");
}

TEST_CASE("Format - Half up")
{
    CheckFormat(123.456, 0, "123");
    CheckFormat(0.5, 0, "1");
    CheckFormat(0.4, 0, "0");
    CheckFormat(2.5, 0, "3");
    CheckFormat(-2.5, 0, "-3");
    CheckFormat(-1.5, 0, "-2");
    CheckFormat(9.5, 0, "10");
    CheckFormat(99.5, 0, "100");
    CheckFormat(0.05, 1, "0.1");
    CheckFormat(0.005, 2, "0.01");
    CheckFormat(0.0004, 2, "0.00");
    CheckFormat(0.125, 2, "0.13");
    CheckFormat(0.375, 2, "0.38");
    CheckFormat(0.749, 2, "0.75");
    CheckFormat(1.1235, 3, "1.124");

    // The shortest representations are "2.675" and "1.005", although the
    // binary values are slightly below.
    CheckFormat(2.675, 2, "2.68");
    CheckFormat(1.005, 2, "1.01");
}

TEST_CASE("Format - Negative zero")
{
    CheckFormat(-0.0, 0, "-0");
    CheckFormat(-0.0, 2, "-0.00");
    CheckFormat(-0.001, 2, "-0.00");
    CheckFormat(-1e-300, 5, "-0.00000");
}

TEST_CASE("Format - Jdk trailing zeros")
{
    CheckFormatJdk(0.0, 2, "0");
    CheckFormatJdk(0.01, 1, "0");
    CheckFormatJdk(-0.01, 1, "-0");
    CheckFormatJdk(0.01, 3, "0.010");
    CheckFormatJdk(1.5, 2, "1.50");
    CheckFormatJdk(1.0, 2, "1");
    CheckFormatJdk(100.0, 2, "100");
    CheckFormatJdk(9.99, 1, "10");
    CheckFormatJdk(99.99, 1, "100");
    CheckFormatJdk(0.95, 1, "1");
    CheckFormatJdk(0.999, 2, "1.0");
    CheckFormatJdk(0.9999999, 3, "1.00");
    CheckFormatJdk(10.001, 1, "10.0");
    CheckFormatJdk(295.335, 2, "295.34");
    CheckFormatJdk(9999999999999.99, 1, "10000000000000");
    CheckFormatJdk(9223372036854.77, 3, "9223372036854.770");
    CheckFormatJdk(9007199254740992.0, 9, "9007199254740992");
}

TEST_CASE("Format - Special values")
{
    const double inf = std::numeric_limits<double>::infinity();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    CHECK(fpround::Format(inf, 2) == "Infinity");
    CHECK(fpround::Format(-inf, 2) == "-Infinity");
    CHECK(fpround::Format(nan, 2) == "NaN");
    CHECK(fpround::Format(nan, 2, TrailingZeros::jdk) == "NaN");

    // Negative precision returns the shortest representation.
    CHECK(fpround::Format(1.5, -1) == "1.5");
    CHECK(fpround::Format(1.0e10, -1) == "1.0E10");
    CHECK(fpround::Format(-0.0, -1) == "-0.0");
    CHECK(fpround::Format(5e-324, -2) == "4.9E-324");
}

TEST_CASE("Format - Large precision")
{
    CheckFormat(1e300, 2, "1" + std::string(300, '0') + ".00");
    CheckFormatJdk(1e300, 2, "1" + std::string(300, '0'));
    CheckFormat(1e300, 1000, "1" + std::string(300, '0') + "." + std::string(1000, '0'));

    CheckFormat(1.7976931348623157e308, 0, "17976931348623157" + std::string(292, '0'));

    CheckFormat(5e-324, 2, "0.00");
    CheckFormat(5e-324, 325, "0." + std::string(323, '0') + "49");
    CheckFormat(5e-324, 330, "0." + std::string(323, '0') + "4900000");
    CheckFormat(5e-324, 324, "0." + std::string(323, '0') + "5");
    CheckFormat(5e-324, 323, "0." + std::string(323, '0'));
}

TEST_CASE("Format - Reference")
{
    static const double values[] = {
        0.0, 1.0, 0.5, 0.25, 0.1, 0.2, 0.3, 1.0 / 3.0, 2.0 / 3.0,
        0.015, 0.045, 0.0449999, 1.45, 2.5, 3.5, 1234.5678, 99.995, 999.9995,
        3.14159265358979, 2.718281828459045, 1.0e-5, 1.23456e-10, 9.87654321e15,
        1.0e22, 1.0e23, 123456789012345680.0, 4.35, 0.000999,
        -0.5, -0.125, -1.005, -999.99, -1.0e-7,
    };

    for (double value : values)
    {
        for (int precision = 0; precision <= 25; ++precision)
        {
            CheckReference(value, precision);
        }
    }

    std::mt19937_64 random;
    std::uniform_real_distribution<double> mantissa(-10.0, 10.0);
    std::uniform_int_distribution<int> exponent(-30, 30);
    std::uniform_int_distribution<int> precision(0, 40);

    for (int i = 0; i < 20000; ++i)
    {
        const double value = mantissa(random) * std::pow(10.0, exponent(random));
        CheckReference(value, precision(random));
    }
}
