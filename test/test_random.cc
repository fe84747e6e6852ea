#include "../src/fpround.h"

#include <catch2/catch.hpp>

#include <cinttypes>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <random>
#include <string>

#include "scan_number.h"
#include "test_util.h"

//==================================================================================================
//
//==================================================================================================

// Returns the seed from the FPROUND_SEED environment variable, or a fresh
// random seed. The seed is printed so that failures can be reproduced.
static uint64_t GetSeed()
{
    static const uint64_t seed = [] {
        uint64_t s;
        if (const char* env = std::getenv("FPROUND_SEED"))
            s = std::strtoull(env, nullptr, 10);
        else
            s = std::random_device{}();

        printf("FPROUND_SEED=%" PRIu64 "\n", s);
        return s;
    }();

    return seed;
}

static constexpr int NumIterations = 200000;

//==================================================================================================
//
//==================================================================================================

TEST_CASE("Random - Double - Shortest")
{
    std::mt19937_64 random(GetSeed());

    for (int i = 0; i < NumIterations; ++i)
    {
        const uint64_t bits = random();
        const double value = ReinterpretBits<double>(bits);
        if (!std::isfinite(value))
            continue;

        const std::string str = fpround::ToString(value);
        CAPTURE(bits);
        CAPTURE(str);

        const double value1 = StrtodDoubleConversion(str);
        CHECK(ReinterpretBits<uint64_t>(value1) == bits);

        if (value > MaxTwoDigitDouble || value < -MaxTwoDigitDouble)
        {
            const std::string ref = ShortestDoubleConversion(value);
            CAPTURE(ref);

            const auto num0 = ScanNumber(str);
            const auto num1 = ScanNumber(ref);
            CHECK(num0.digits == num1.digits);
            CHECK(num0.exponent == num1.exponent);
        }
    }
}

TEST_CASE("Random - Single - Shortest")
{
    std::mt19937 random(static_cast<std::mt19937::result_type>(GetSeed()));

    for (int i = 0; i < NumIterations; ++i)
    {
        const uint32_t bits = random();
        const float value = ReinterpretBits<float>(bits);
        if (!std::isfinite(value))
            continue;

        const std::string str = fpround::ToString(value);
        CAPTURE(bits);
        CAPTURE(str);

        const float value1 = StrtofDoubleConversion(str);
        CHECK(ReinterpretBits<uint32_t>(value1) == bits);

        if (value > MaxTwoDigitSingle || value < -MaxTwoDigitSingle)
        {
            const std::string ref = ShortestDoubleConversion(value);
            CAPTURE(ref);

            const auto num0 = ScanNumber(str);
            const auto num1 = ScanNumber(ref);
            CHECK(num0.digits == num1.digits);
            CHECK(num0.exponent == num1.exponent);
        }
    }
}

TEST_CASE("Random - Format")
{
    std::mt19937_64 random(GetSeed());
    std::uniform_int_distribution<uint64_t> significand(1, (uint64_t{1} << 53) - 1);
    std::uniform_int_distribution<int> exponent(-80, 40);
    std::uniform_int_distribution<int> precision(0, 24);

    for (int i = 0; i < NumIterations / 10; ++i)
    {
        const double value = std::ldexp(static_cast<double>(significand(random)), exponent(random));
        const int p = precision(random);

        CAPTURE(value);
        CAPTURE(p);

        const std::string str = fpround::Format(value, p);
        CAPTURE(str);

        // The result has exactly p fractional digits.
        const auto dot = str.find('.');
        if (p == 0)
        {
            CHECK(dot == std::string::npos);
        }
        else
        {
            REQUIRE(dot != std::string::npos);
            CHECK(str.size() - dot - 1 == static_cast<size_t>(p));
        }

        // Formatting the parsed result again gives the same string.
        const double value1 = StrtodDoubleConversion(str);
        CHECK(fpround::Format(value1, p) == str);
        CHECK(fpround::Round(value, p) == value1);

        // The JDK mode only differs in the number of trailing zeros.
        const std::string jdk = fpround::Format(value, p, fpround::TrailingZeros::jdk);
        CAPTURE(jdk);
        CHECK(StrtodDoubleConversion(jdk) == value1);
    }
}
