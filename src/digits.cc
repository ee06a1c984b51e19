// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "digits.h"

#include "diy_fp.h"

using namespace radix_conv;

ParseDigitsResult radix_conv::ParseDigitsChecked(uint64_t& value, int radix, char const* first, char const* last)
{
    RADIX_CONV_ASSERT(radix >= 2);
    RADIX_CONV_ASSERT(radix <= 36);

    uint64_t const r = static_cast<uint64_t>(radix);

    char const* p = first;
    for ( ; p != last; ++p)
    {
        uint32_t const digit = CharToDigit(*p);
        if (digit >= r)
            return {p, 0};

        uint64_t next_value;
        if (!MultiplyU64(next_value, value, r) || next_value > UINT64_MAX - digit)
            break;

        value = next_value + digit;
    }

    // Overflow (or end of input).
    // Scan the remaining digits without accumulating them.
    char const* const overflow_pos = p;
    for ( ; p != last && IsDigit(*p, radix); ++p)
    {
    }

    return {p, p - overflow_pos};
}

ParseExponentResult radix_conv::ParseExponent(int radix, char const* first, char const* last)
{
    RADIX_CONV_ASSERT(radix >= 2);
    RADIX_CONV_ASSERT(radix <= 36);

    char const* p = first;
    if (p == last)
        return {0, first};

    char const marker = ExponentMarker(radix);
    char const ch = *p;
    if (ch != marker && !(marker == 'e' && ch == 'E'))
        return {0, first};

    ++p;
    if (p == last)
        return {0, first};

    bool const is_neg = (*p == '-');
    if (is_neg || *p == '+')
    {
        ++p;
        if (p == last)
            return {0, first};
    }

    if (!IsDigit(*p, radix))
        return {0, first};

    // Accumulate the magnitude as a negative number, so that INT_MIN is representable.
    int const limit = is_neg ? INT_MIN : -INT_MAX;

    int num = 0;
    for ( ; p != last; ++p)
    {
        int const digit = static_cast<int>(CharToDigit(*p));
        if (digit >= radix)
            break;

        if (num < (limit + digit) / radix)
        {
            num = limit;
            break;
        }

        num = num * radix - digit;
    }

    // Skip the rest of the exponent (saturated).
    for ( ; p != last && IsDigit(*p, radix); ++p)
    {
    }

    return {is_neg ? num : -num, p};
}
