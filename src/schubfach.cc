// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

// Implements the Schubfach algorithm by Raffaello Giulietti:
// "The Schubfach way to render doubles", https://drive.google.com/open?id=1luHhyQF9zKlM8yJ1nebU0OgVYhfC6CBN

#include "schubfach.h"

#include "format_digits.h"
#include "ieee.h"
#include "pow10_table.h"

#include <cassert>
#include <cstdint>
#if _MSC_VER
#include <intrin.h>
#endif

#ifndef FPROUND_ASSERT
#define FPROUND_ASSERT(X) assert(X)
#endif

using namespace fpround::impl;

//==================================================================================================
//
//==================================================================================================

// Returns floor(log_10(2^e))
static inline int32_t FloorLog10Pow2(int32_t e)
{
    FPROUND_ASSERT(e >= -2620);
    FPROUND_ASSERT(e <=  2620);
    return static_cast<int32_t>((int64_t{e} * 661971961083) >> 41);
}

// Returns floor(log_10(3/4 2^e))
static inline int32_t FloorLog10ThreeQuartersPow2(int32_t e)
{
    FPROUND_ASSERT(e >= -2620);
    FPROUND_ASSERT(e <=  2620);
    return static_cast<int32_t>((int64_t{e} * 661971961083 - 274743187321) >> 41);
}

// Returns floor(log_2(10^e))
static inline int32_t FloorLog2Pow10(int32_t e)
{
    FPROUND_ASSERT(e >= -1233);
    FPROUND_ASSERT(e <=  1233);
    return static_cast<int32_t>((int64_t{e} * 913124641741) >> 38);
}

#if defined(__SIZEOF_INT128__)

static inline uint64x2 Mul128(uint64_t a, uint64_t b)
{
    __extension__ using uint128_t = unsigned __int128;

    const uint128_t p = uint128_t{a} * b;
    return {static_cast<uint64_t>(p >> 64), static_cast<uint64_t>(p)};
}

#elif defined(_MSC_VER) && defined(_M_X64)

static inline uint64x2 Mul128(uint64_t a, uint64_t b)
{
    uint64_t hi;
    uint64_t lo = _umul128(a, b, &hi);
    return {hi, lo};
}

#else

static inline uint32_t Lo32(uint64_t x)
{
    return static_cast<uint32_t>(x & 0xFFFFFFFFu);
}

static inline uint32_t Hi32(uint64_t x)
{
    return static_cast<uint32_t>(x >> 32);
}

static inline uint64x2 Mul128(uint64_t a, uint64_t b)
{
    const uint64_t b00 = uint64_t{Lo32(a)} * Lo32(b);
    const uint64_t b01 = uint64_t{Lo32(a)} * Hi32(b);
    const uint64_t b10 = uint64_t{Hi32(a)} * Lo32(b);
    const uint64_t b11 = uint64_t{Hi32(a)} * Hi32(b);

    const uint64_t mid1 = b10 + Hi32(b00);
    const uint64_t mid2 = b01 + Lo32(mid1);

    const uint64_t hi = b11 + Hi32(mid1) + Hi32(mid2);
    const uint64_t lo = Lo32(b00) | uint64_t{Lo32(mid2)} << 32;
    return {hi, lo};
}

#endif

//==================================================================================================
// Format traits
//==================================================================================================

namespace {

template <typename Float>
struct SchubfachTraits;

template <>
struct SchubfachTraits<double>
{
    // Subnormal significands below this value are scaled by 10 before the
    // conversion, so that the result has at least 2 digits.
    static constexpr uint64_t TinySignificand = 3;

    // h = q + floor(log_2(10^-k)) + ExtraShift
    static constexpr int32_t ExtraShift = 2;

    // Returns the round-to-odd of g * cp / 2^127.
    static uint64_t RoundToOdd(uint64x2 g, uint64_t cp)
    {
        constexpr uint64_t Mask63 = (uint64_t{1} << 63) - 1;

        const uint64x2 x = Mul128(g.lo, cp);
        const uint64x2 y = Mul128(g.hi, cp);

        const uint64_t z = (y.lo >> 1) + x.hi;
        const uint64_t vbp = y.hi + (z >> 63);
        return vbp | (((z & Mask63) + Mask63) >> 63);
    }
};

template <>
struct SchubfachTraits<float>
{
    static constexpr uint64_t TinySignificand = 8;
    static constexpr int32_t ExtraShift = 33;

    // Returns the round-to-odd of (g1 + 1) * cp / 2^95.
    // The single-precision algorithm only needs the upper word of g.
    static uint64_t RoundToOdd(uint64x2 g, uint64_t cp)
    {
        constexpr uint64_t Mask32 = (uint64_t{1} << 32) - 1;

        const uint64_t x1 = Mul128(g.hi + 1, cp).hi;
        const uint64_t vbp = x1 >> 31;
        return static_cast<uint32_t>(vbp | (((x1 & Mask32) + Mask32) >> 32));
    }
};

} // namespace

//==================================================================================================
// ToDecimal
//==================================================================================================

static inline fpround::ExactDecimal MakeDecimal(uint64_t f, int32_t e)
{
    FPROUND_ASSERT(f != 0);
    return {f, e, DecimalLength(f)};
}

// Computes the shortest decimal in the rounding interval of c * 2^q.
// The result is scaled by 10^dk.
template <typename Float>
static inline fpround::ExactDecimal ToDecimal(uint64_t c, int32_t q, int32_t dk)
{
    using Fp = fpround::IEEE<Float>;
    using Traits = SchubfachTraits<Float>;

    FPROUND_ASSERT(c != 0);

    const uint64_t out = c & 1;
    const uint64_t cb = c << 2;
    const uint64_t cbr = cb + 2;

    uint64_t cbl;
    int32_t k;
    if (c != Fp::HiddenBit || q == Fp::MinExponent)
    {
        // Regular spacing.
        cbl = cb - 2;
        k = FloorLog10Pow2(q);
    }
    else
    {
        // Irregular spacing: the lower neighbor is closer.
        cbl = cb - 1;
        k = FloorLog10ThreeQuartersPow2(q);
    }

    const int32_t h = q + FloorLog2Pow10(-k) + Traits::ExtraShift;
    FPROUND_ASSERT(h >= 0);
    FPROUND_ASSERT(h <= 63 - 2 - Fp::SignificandSize);

    const uint64x2 g = ComputePow10(k);

    const uint64_t vb  = Traits::RoundToOdd(g, cb << h);
    const uint64_t vbl = Traits::RoundToOdd(g, cbl << h);
    const uint64_t vbr = Traits::RoundToOdd(g, cbr << h);

    const uint64_t s = vb >> 2;
    if (s >= 100)
    {
        // Try the candidates with one digit less first:
        //  u' = sp10 10^k and w' = tp10 10^k.
        const uint64_t sp10 = s / 10 * 10;
        const uint64_t tp10 = sp10 + 10;

        const bool upin = vbl + out <= (sp10 << 2);
        const bool wpin = (tp10 << 2) + out <= vbr;
        if (upin != wpin)
        {
            return MakeDecimal(upin ? sp10 : tp10, k + dk);
        }
    }

    // u = s 10^k and w = t 10^k.
    const uint64_t t = s + 1;

    const bool uin = vbl + out <= (s << 2);
    const bool win = (t << 2) + out <= vbr;
    if (uin != win)
    {
        return MakeDecimal(uin ? s : t, k + dk);
    }

    // Both (or none) are in the rounding interval. Pick the one closest to v,
    // and the even one in case of a tie.
    const uint64_t mid = (s + t) << 1;
    const bool pick_s = vb < mid || (vb == mid && (s & 1) == 0);
    return MakeDecimal(pick_s ? s : t, k + dk);
}

template <typename Float>
static inline fpround::ExactDecimal ShortestDecimalImpl(Float value)
{
    using Fp = fpround::IEEE<Float>;
    using Traits = SchubfachTraits<Float>;

    const auto v = fpround::Decompose(value);
    FPROUND_ASSERT(v.kind == fpround::FloatKind::normal || v.kind == fpround::FloatKind::subnormal);

    const uint64_t c = v.c;
    const int32_t q = v.q;

    if (v.kind == fpround::FloatKind::normal)
    {
        // Small integers are emitted directly.
        const int32_t mq = -q;
        if (0 < mq && mq < Fp::SignificandSize)
        {
            const uint64_t f = c >> mq;
            if ((f << mq) == c)
            {
                return MakeDecimal(f, 0);
            }
        }

        return ToDecimal<Float>(c, q, 0);
    }

    if (c < Traits::TinySignificand)
    {
        return ToDecimal<Float>(10 * c, q, -1);
    }

    return ToDecimal<Float>(c, q, 0);
}

//==================================================================================================
//
//==================================================================================================

fpround::ExactDecimal fpround::schubfach::ShortestDecimal(double value)
{
    return ShortestDecimalImpl(value);
}

fpround::ExactDecimal fpround::schubfach::ShortestDecimal(float value)
{
    return ShortestDecimalImpl(value);
}
