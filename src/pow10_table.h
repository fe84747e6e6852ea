// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstdint>

namespace fpround {
namespace impl {

struct uint64x2 {
    uint64_t hi;
    uint64_t lo;
};

constexpr int32_t Pow10MinDecExp = -324;
constexpr int32_t Pow10MaxDecExp =  292;

// Returns g = floor(beta) + 1, where 10^-k = beta 2^r and 2^125 <= beta < 2^126,
// split into two 63-bit words: g = hi 2^63 + lo.
//
// PRE: Pow10MinDecExp <= k <= Pow10MaxDecExp
uint64x2 ComputePow10(int32_t k);

} // namespace impl
} // namespace fpround
