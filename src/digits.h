// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "config.h"

#include <climits>
#include <cstddef>
#include <cstdint>

namespace radix_conv {

//==================================================================================================
// Digit scanning
//==================================================================================================

// Returns the value of the digit ch:
// '0'...'9' map to 0...9, 'a'...'z' and 'A'...'Z' map to 10...35.
// Any other character maps to a value >= 36.
inline uint32_t CharToDigit(char ch)
{
    if ('0' <= ch && ch <= '9')
        return static_cast<uint32_t>(ch - '0');
    if ('a' <= ch && ch <= 'z')
        return static_cast<uint32_t>(ch - 'a' + 10);
    if ('A' <= ch && ch <= 'Z')
        return static_cast<uint32_t>(ch - 'A' + 10);

    return 36;
}

inline bool IsDigit(char ch, int radix)
{
    RADIX_CONV_ASSERT(radix >= 2);
    RADIX_CONV_ASSERT(radix <= 36);

    return CharToDigit(ch) < static_cast<uint32_t>(radix);
}

// Returns the first position in [first, last) which is not a '0'.
inline char const* SkipZeros(char const* first, char const* last)
{
    for ( ; first != last && *first == '0'; ++first)
    {
    }
    return first;
}

//--------------------------------------------------------------------------------------------------
// Saturating arithmetic for exponents
//--------------------------------------------------------------------------------------------------

inline int SaturatingAdd(int x, int y)
{
    if (y > 0 && x > INT_MAX - y)
        return INT_MAX;
    if (y < 0 && x < INT_MIN - y)
        return INT_MIN;

    return x + y;
}

inline int SaturatingSub(int x, int y)
{
    if (y < 0 && x > INT_MAX + y)
        return INT_MAX;
    if (y > 0 && x < INT_MIN + y)
        return INT_MIN;

    return x - y;
}

// Converts a (digit) count into an int, saturating at INT_MAX.
inline int SaturatingIntFromSize(ptrdiff_t n)
{
    RADIX_CONV_ASSERT(n >= 0);
    return n > INT_MAX ? INT_MAX : static_cast<int>(n);
}

//--------------------------------------------------------------------------------------------------
// Checked digit accumulation
//--------------------------------------------------------------------------------------------------

struct ParseDigitsResult {
    char const* next;
    ptrdiff_t truncated; // Number of digits which have been scanned, but not folded into the value.
};

// Folds the digits at the start of [first, last) into value, i.e. value := value * radix + digit.
// Once the value would overflow 64 bits, the remaining digits are only scanned.
ParseDigitsResult ParseDigitsChecked(uint64_t& value, int radix, char const* first, char const* last);

//--------------------------------------------------------------------------------------------------
// Exponent
//--------------------------------------------------------------------------------------------------

// Returns the lower-case exponent marker for the given radix.
// 'e' is a digit for radix >= 15, so these use '^' instead.
inline char ExponentMarker(int radix)
{
    return radix <= 14 ? 'e' : '^';
}

struct ParseExponentResult {
    int exponent;
    char const* next;
};

// Parses an exponent of the form
//
//      marker [+-] digit+
//
// with digits in the given radix.
// The value saturates at INT_MAX and INT_MIN; the digits beyond the saturation point are skipped.
// If [first, last) does not start with a complete exponent, returns {0, first}.
ParseExponentResult ParseExponent(int radix, char const* first, char const* last);

} // namespace radix_conv
