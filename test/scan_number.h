#pragma once

#include <cassert>
#include <cstdint>
#include <string>

// A decimal number in normalized form: digits * 10^exponent, with no leading
// or trailing zeros in digits. Zero is represented as {"0", 0}.
struct ScanNumberResult {
    bool is_negative;
    std::string digits;
    int exponent;
};

inline bool IsDigit(char ch)
{
    return '0' <= ch && ch <= '9';
}

inline int DigitValue(char ch)
{
    assert(IsDigit(ch));
    return ch - '0';
}

// Accepts numbers of the form [-]ddd[.ddd][(e|E)[+|-]nnn].
inline ScanNumberResult ScanNumber(char const* next, char const* last)
{
    std::string digits;
    int exponent = 0;

    assert(next != last);

    bool const is_negative = (*next == '-');
    if (is_negative)
    {
        ++next;
        assert(next != last);
    }

    assert(IsDigit(*next));

    // Leading zeros are not significant.
    while (next != last && *next == '0')
        ++next;

    while (next != last && IsDigit(*next))
    {
        digits += *next;
        ++next;
    }

    if (next != last && *next == '.')
    {
        ++next;
        assert(next != last);
        assert(IsDigit(*next));

        while (next != last && IsDigit(*next))
        {
            if (!digits.empty() || *next != '0')
                digits += *next;
            --exponent;
            ++next;
        }
    }

    if (next != last && (*next == 'e' || *next == 'E'))
    {
        ++next;
        assert(next != last);

        bool const exp_is_neg = (*next == '-');
        if (exp_is_neg || *next == '+')
        {
            ++next;
            assert(next != last);
        }

        // No overflow checks...
        int e = 0;
        while (next != last)
        {
            e = 10 * e + DigitValue(*next);
            ++next;
        }

        exponent += exp_is_neg ? -e : e;
    }

    assert(next == last);

    // Move trailing zeros into the exponent
    while (!digits.empty() && digits.back() == '0')
    {
        digits.pop_back();
        exponent++;
    }

    // Normalize "0.0" and "0"
    if (digits.empty())
    {
        return {is_negative, "0", 0};
    }

    return {is_negative, digits, exponent};
}

inline ScanNumberResult ScanNumber(std::string const& str)
{
    char const* next = str.c_str();
    char const* last = str.c_str() + str.size();

    return ScanNumber(next, last);
}
