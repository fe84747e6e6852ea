#include "../src/fpround.h"

#include <catch2/catch.hpp>

#include <cstdint>
#include <limits>
#include <random>
#include <string>

#include "test_util.h"

//==================================================================================================
//
//==================================================================================================

static uint64_t Pow10(int n)
{
    uint64_t p = 1;
    for (int i = 0; i < n; ++i)
        p *= 10;
    return p;
}

static std::string ToScientific(fpround::ExactDecimal const& dec)
{
    return std::to_string(dec.digits) + "e" + std::to_string(dec.exponent);
}

static void CheckSplit(double value, uint64_t digits, int exponent, int num_digits)
{
    const fpround::ExactDecimal dec = fpround::Split(value);

    CAPTURE(value);
    CHECK(dec.digits == digits);
    CHECK(dec.exponent == exponent);
    CHECK(dec.num_digits == num_digits);
}

static void CheckSplit(float value, uint64_t digits, int exponent, int num_digits)
{
    const fpround::ExactDecimal dec = fpround::Split(value);

    CAPTURE(value);
    CHECK(dec.digits == digits);
    CHECK(dec.exponent == exponent);
    CHECK(dec.num_digits == num_digits);
}

// digits * 10^exponent must read back as value, and num_digits must be the
// number of decimal digits of 'digits'.
static void CheckInvariants(double value)
{
    const fpround::ExactDecimal dec = fpround::Split(value);

    CAPTURE(value);
    CAPTURE(dec.digits);
    CAPTURE(dec.exponent);
    CAPTURE(dec.num_digits);

    REQUIRE(dec.digits != 0);
    REQUIRE(dec.num_digits >= 1);
    REQUIRE(dec.num_digits <= 17);
    CHECK(dec.digits >= Pow10(dec.num_digits - 1));
    CHECK(dec.digits < Pow10(dec.num_digits));

    const double value1 = StrtodDoubleConversion(ToScientific(dec));
    CHECK(ReinterpretBits<uint64_t>(value) == ReinterpretBits<uint64_t>(value1));
}

static void CheckInvariants(float value)
{
    const fpround::ExactDecimal dec = fpround::Split(value);

    CAPTURE(value);
    CAPTURE(dec.digits);
    CAPTURE(dec.exponent);
    CAPTURE(dec.num_digits);

    REQUIRE(dec.digits != 0);
    REQUIRE(dec.num_digits >= 1);
    REQUIRE(dec.num_digits <= 9);
    CHECK(dec.digits >= Pow10(dec.num_digits - 1));
    CHECK(dec.digits < Pow10(dec.num_digits));

    const float value1 = StrtofDoubleConversion(ToScientific(dec));
    CHECK(ReinterpretBits<uint32_t>(value) == ReinterpretBits<uint32_t>(value1));
}

//==================================================================================================
//
//==================================================================================================

TEST_CASE("Split - Zero")
{
    CheckSplit(0.0, 0, 0, 0);
    CheckSplit(-0.0, 0, 0, 0);
    CheckSplit(0.0f, 0, 0, 0);
}

TEST_CASE("Split - Double")
{
    CheckSplit(1.0, 1, 0, 1);
    CheckSplit(1000.0, 1000, 0, 4);
    CheckSplit(123.45, 12345000000000000, -14, 17);
    CheckSplit(0.1, 10000000000000000, -17, 17);
    CheckSplit(1.0e23, 10000000000000000, 7, 17);
    CheckSplit(std::numeric_limits<double>::max(), 17976931348623157, 292, 17);
    CheckSplit(std::numeric_limits<double>::denorm_min(), 49, -325, 2);
    CheckSplit(MakeDouble(20, -1074), 99, -324, 2);
}

TEST_CASE("Split - Single")
{
    CheckSplit(1.0f, 1, 0, 1);
    CheckSplit(0.1f, 100000000, -9, 9);
    CheckSplit(8388608.0f, 83886080, -1, 8);
    CheckSplit(std::numeric_limits<float>::max(), 34028235, 31, 8);
    CheckSplit(std::numeric_limits<float>::denorm_min(), 14, -46, 2);
}

TEST_CASE("Split - Integers")
{
    // Integers below 2^53 with a small binary exponent are returned as is.
    CheckSplit(2.0, 2, 0, 1);
    CheckSplit(12345.0, 12345, 0, 5);
    CheckSplit(4503599627370497.0, 4503599627370497, 0, 16);
    CheckSplit(9007199254740991.0, 9007199254740991, 0, 16);

    CheckSplit(3.0f, 3, 0, 1);
    CheckSplit(16777215.0f, 16777215, 0, 8);
}

TEST_CASE("Split - Invariants")
{
    for (uint64_t e = 0; e < 2047; ++e)
    {
        CheckInvariants(MakeDouble(0, e, 0x0000000000000001));
        CheckInvariants(MakeDouble(0, e, 0x000FFFFFFFFFFFFF));
        if (e > 0)
            CheckInvariants(MakeDouble(0, e, 0x0000000000000000));
    }

    for (uint32_t e = 0; e < 255; ++e)
    {
        CheckInvariants(MakeSingle(0, e, 0x00000001));
        CheckInvariants(MakeSingle(0, e, 0x007FFFFF));
        if (e > 0)
            CheckInvariants(MakeSingle(0, e, 0x00000000));
    }

    std::mt19937_64 random;
    for (int i = 0; i < 100000; ++i)
    {
        const uint64_t bits = random() & 0x7FFFFFFFFFFFFFFF;
        const double value = ReinterpretBits<double>(bits);
        if (value == 0.0 || value > std::numeric_limits<double>::max())
            continue;
        CheckInvariants(value);
    }
}
