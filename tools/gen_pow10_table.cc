// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

// Prints the table of g = floor(beta) + 1, where 10^-k = beta 2^r and 2^125 <= beta < 2^126,
// for Pow10MinDecExp <= k <= Pow10MaxDecExp, split into two 63-bit words.

#include "../src/pow10_table.h"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <vector>

namespace {

// Arbitrary precision unsigned integer, little-endian base 2^32.
struct BigUint
{
    std::vector<uint32_t> digits;

    static BigUint FromUint64(uint64_t value)
    {
        BigUint x;
        while (value != 0)
        {
            x.digits.push_back(static_cast<uint32_t>(value));
            value >>= 32;
        }
        return x;
    }

    bool IsZero() const { return digits.empty(); }

    int BitLength() const
    {
        if (digits.empty())
            return 0;

        int n = 32 * static_cast<int>(digits.size() - 1);
        for (uint32_t d = digits.back(); d != 0; d >>= 1)
            ++n;
        return n;
    }

    bool Bit(int n) const
    {
        const size_t i = static_cast<size_t>(n / 32);
        return i < digits.size() && ((digits[i] >> (n % 32)) & 1) != 0;
    }

    void Trim()
    {
        while (!digits.empty() && digits.back() == 0)
            digits.pop_back();
    }

    void MulSmall(uint32_t m)
    {
        uint64_t carry = 0;
        for (auto& d : digits)
        {
            const uint64_t p = uint64_t{d} * m + carry;
            d = static_cast<uint32_t>(p);
            carry = p >> 32;
        }
        if (carry != 0)
            digits.push_back(static_cast<uint32_t>(carry));
    }

    void ShiftLeft(int n)
    {
        assert(n >= 0);

        if (digits.empty())
            return;

        const int words = n / 32;
        const int bits = n % 32;

        if (bits != 0)
        {
            uint32_t carry = 0;
            for (auto& d : digits)
            {
                const uint32_t next_carry = d >> (32 - bits);
                d = (d << bits) | carry;
                carry = next_carry;
            }
            if (carry != 0)
                digits.push_back(carry);
        }

        digits.insert(digits.begin(), static_cast<size_t>(words), 0u);
    }

    // x = floor(x / 2^n)
    void ShiftRight(int n)
    {
        assert(n >= 0);

        const size_t words = static_cast<size_t>(n / 32);
        const int bits = n % 32;

        if (words >= digits.size())
        {
            digits.clear();
            return;
        }

        digits.erase(digits.begin(), digits.begin() + static_cast<std::ptrdiff_t>(words));

        if (bits != 0)
        {
            for (size_t i = 0; i < digits.size(); ++i)
            {
                const uint32_t next = (i + 1 < digits.size()) ? digits[i + 1] : 0u;
                digits[i] = (digits[i] >> bits) | (next << (32 - bits));
            }
        }

        Trim();
    }

    void AddSmall(uint32_t a)
    {
        uint64_t carry = a;
        for (auto& d : digits)
        {
            if (carry == 0)
                break;
            const uint64_t s = uint64_t{d} + carry;
            d = static_cast<uint32_t>(s);
            carry = s >> 32;
        }
        if (carry != 0)
            digits.push_back(static_cast<uint32_t>(carry));
    }

    // PRE: *this >= y
    void Sub(BigUint const& y)
    {
        int64_t borrow = 0;
        for (size_t i = 0; i < digits.size(); ++i)
        {
            int64_t d = int64_t{digits[i]} - borrow - (i < y.digits.size() ? int64_t{y.digits[i]} : 0);
            borrow = 0;
            if (d < 0)
            {
                d += int64_t{1} << 32;
                borrow = 1;
            }
            digits[i] = static_cast<uint32_t>(d);
        }
        assert(borrow == 0);
        Trim();
    }

    // Returns the lowest 64 bits of floor(x / 2^n).
    uint64_t Extract64(int n) const
    {
        uint64_t r = 0;
        for (int i = 63; i >= 0; --i)
            r = (r << 1) | (Bit(n + i) ? 1u : 0u);
        return r;
    }
};

int Compare(BigUint const& x, BigUint const& y)
{
    if (x.digits.size() != y.digits.size())
        return x.digits.size() < y.digits.size() ? -1 : 1;

    for (size_t i = x.digits.size(); i-- > 0; )
    {
        if (x.digits[i] != y.digits[i])
            return x.digits[i] < y.digits[i] ? -1 : 1;
    }
    return 0;
}

BigUint Pow10(int k)
{
    BigUint x = BigUint::FromUint64(1);
    for (int i = 0; i < k; ++i)
        x.MulSmall(10);
    return x;
}

// Returns floor(2^(len - 1 + 126) / d), where len = bit length of d.
// PRE: d is not a power of 2
BigUint DivideIntoPow2(BigUint const& d)
{
    // Restoring division. The remainder starts at 2^(len - 1) < d, so each of
    // the 126 steps produces exactly one quotient bit.
    BigUint r = BigUint::FromUint64(1);
    r.ShiftLeft(d.BitLength() - 1);

    BigUint q;
    for (int i = 0; i < 126; ++i)
    {
        r.ShiftLeft(1);
        q.ShiftLeft(1);
        if (Compare(r, d) >= 0)
        {
            r.Sub(d);
            if (q.IsZero())
                q.digits.push_back(1);
            else
                q.digits[0] |= 1;
        }
    }
    return q;
}

// Returns g for the given k.
BigUint ComputeG(int k)
{
    BigUint beta;
    if (k <= 0)
    {
        // 10^-k is an integer.
        beta = Pow10(-k);
        const int len = beta.BitLength();
        if (len <= 126)
            beta.ShiftLeft(126 - len);
        else
            beta.ShiftRight(len - 126);
    }
    else
    {
        // beta = 2^s / 10^k, with s = bit length of 10^k - 1 + 126
        beta = DivideIntoPow2(Pow10(k));
    }

    beta.AddSmall(1);
    return beta;
}

} // namespace

int main()
{
    using namespace fpround::impl;

    constexpr uint64_t Mask63 = (uint64_t{1} << 63) - 1;

    for (int k = Pow10MinDecExp; k <= Pow10MaxDecExp; ++k)
    {
        const BigUint g = ComputeG(k);
        assert(g.BitLength() <= 126);

        const uint64_t hi = g.Extract64(63) & Mask63;
        const uint64_t lo = g.Extract64(0) & Mask63;

        printf("        {0x%016llX, 0x%016llX}, // k = %4d\n",
            static_cast<unsigned long long>(hi), static_cast<unsigned long long>(lo), k);
    }

    return 0;
}
