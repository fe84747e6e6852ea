// Copyright 2019 Alexander Bolz
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <cstdint>
#include <cstring>
#include <limits>

namespace fpround {

namespace impl {

template <typename Dest, typename Source>
inline Dest ReinterpretBits(Source source)
{
    static_assert(sizeof(Dest) == sizeof(Source), "size mismatch");

    Dest dest;
    std::memcpy(&dest, &source, sizeof(Source));
    return dest;
}

template <int Precision> struct BitsType;
template <> struct BitsType<24> { using type = uint32_t; };
template <> struct BitsType<53> { using type = uint64_t; };

} // namespace impl

enum class FloatKind {
    zero,
    subnormal,
    normal,
    infinite,
    nan,
};

template <typename Float>
struct IEEE
{
    static_assert(std::numeric_limits<Float>::is_iec559 &&
                  ((std::numeric_limits<Float>::digits == 24 && std::numeric_limits<Float>::max_exponent == 128) ||
                   (std::numeric_limits<Float>::digits == 53 && std::numeric_limits<Float>::max_exponent == 1024)),
        "IEEE-754 single- or double-precision implementation required");

    using value_type = Float;
    using bits_type = typename fpround::impl::BitsType<std::numeric_limits<Float>::digits>::type;

    static constexpr int32_t   SignificandSize = std::numeric_limits<value_type>::digits; // = p   (includes the hidden bit)
    static constexpr int32_t   ExponentBias    = std::numeric_limits<value_type>::max_exponent - 1 + (SignificandSize - 1);
    static constexpr int32_t   MinExponent     = 1 - ExponentBias;                                    // = q_min
    static constexpr int32_t   MaxIeeeExponent = 2 * std::numeric_limits<value_type>::max_exponent - 1;
    static constexpr bits_type HiddenBit       = bits_type{1} << (SignificandSize - 1);   // = 2^(p-1)
    static constexpr bits_type SignificandMask = HiddenBit - 1;                           // = 2^(p-1) - 1
    static constexpr bits_type ExponentMask    = bits_type{MaxIeeeExponent} << (SignificandSize - 1);
    static constexpr bits_type SignMask        = ~(~bits_type{0} >> 1);

    bits_type bits;

    explicit IEEE(bits_type bits_) : bits(bits_) {}
    explicit IEEE(value_type value) : bits(fpround::impl::ReinterpretBits<bits_type>(value)) {}

    bits_type PhysicalSignificand() const {
        return bits & SignificandMask;
    }

    bits_type PhysicalExponent() const {
        return (bits & ExponentMask) >> (SignificandSize - 1);
    }

    bool IsFinite() const {
        return (bits & ExponentMask) != ExponentMask;
    }

    bool IsInf() const {
        return (bits & ExponentMask) == ExponentMask && (bits & SignificandMask) == 0;
    }

    bool IsNaN() const {
        return (bits & ExponentMask) == ExponentMask && (bits & SignificandMask) != 0;
    }

    bool IsZero() const {
        return (bits & ~SignMask) == 0;
    }

    bool SignBit() const {
        return (bits & SignMask) != 0;
    }

    FloatKind Kind() const
    {
        const bits_type e = PhysicalExponent();
        const bits_type t = PhysicalSignificand();

        if (e == bits_type{MaxIeeeExponent})
            return t == 0 ? FloatKind::infinite : FloatKind::nan;
        if (e != 0)
            return FloatKind::normal;
        return t == 0 ? FloatKind::zero : FloatKind::subnormal;
    }

    value_type Value() const {
        return fpround::impl::ReinterpretBits<value_type>(bits);
    }

    value_type AbsValue() const {
        return fpround::impl::ReinterpretBits<value_type>(bits & ~SignMask);
    }
};

// The binary decomposition |v| = c 2^q of a floating-point value.
// For zero, infinite and NaN values, c and q are 0.
template <typename Float>
struct Decomposition
{
    using bits_type = typename IEEE<Float>::bits_type;

    bool sign;
    FloatKind kind;
    bits_type c;
    int32_t q;
};

template <typename Float>
inline Decomposition<Float> Decompose(Float value)
{
    using Fp = IEEE<Float>;
    using bits_type = typename Fp::bits_type;

    const Fp v(value);
    const FloatKind kind = v.Kind();

    switch (kind)
    {
    case FloatKind::normal:
        return {v.SignBit(), kind, Fp::HiddenBit | v.PhysicalSignificand(), static_cast<int32_t>(v.PhysicalExponent()) - Fp::ExponentBias};
    case FloatKind::subnormal:
        return {v.SignBit(), kind, v.PhysicalSignificand(), Fp::MinExponent};
    default:
        return {v.SignBit(), kind, bits_type{0}, 0};
    }
}

} // namespace fpround
