// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "radix_conv.h"

#include "digits.h"
#include "strtod.h"

#include <limits>

using radix_conv::StrtodStatus;
using radix_conv::StrtodResult;

static inline bool IsLowerASCII(char ch)
{
    return 'a' <= ch && ch <= 'z';
}

static inline bool IsUpperASCII(char ch)
{
    return 'A' <= ch && ch <= 'Z';
}

static inline char ToLowerASCII(char ch)
{
    return static_cast<char>(static_cast<unsigned char>(ch) | 0x20);
}

static inline bool StartsWith(char const* next, char const* last, char const* lower_case_prefix)
{
    for ( ; next != last && *lower_case_prefix != '\0'; ++next, ++lower_case_prefix)
    {
        RADIX_CONV_ASSERT(IsLowerASCII(*lower_case_prefix));
        if (ToLowerASCII(*next) != *lower_case_prefix)
            return false;
    }

    return *lower_case_prefix == '\0';
}

static inline StrtodResult ParseInfinity(char const* next, char const* last)
{
    RADIX_CONV_ASSERT(*next == 'i' || *next == 'I');

    if (!StartsWith(next + 1, last, "nf"))
        return {next, StrtodStatus::invalid};

    next += 3;
    if (StartsWith(next, last, "inity"))
        next += 5;

    return {next, StrtodStatus::inf};
}

static inline StrtodResult ParseNaN(char const* next, char const* last)
{
    RADIX_CONV_ASSERT(*next == 'n' || *next == 'N');

    if (!StartsWith(next + 1, last, "an"))
        return {next, StrtodStatus::invalid};

    next += 3;
    if (next != last && *next == '(')
    {
        for (char const* p = next + 1; p != last; ++p)
        {
            if (*p == ')')
                return {p + 1, StrtodStatus::nan};

            if (*p == '_' || ('0' <= *p && *p <= '9') || IsUpperASCII(*p) || IsLowerASCII(*p))
                continue;

            break;
        }

        // Invalid or incomplete nan-sequence.
        // Only "nan" is consumed.
    }

    return {next, StrtodStatus::nan};
}

template <typename Float>
static RADIX_CONV_NEVER_INLINE StrtodResult ParseSpecial(bool is_negative, char const* next, char const* last, Float& value)
{
    if (*next == 'i' || *next == 'I')
    {
        auto const res = ParseInfinity(next, last);
        if (res.status != StrtodStatus::invalid)
        {
            value = is_negative ? -std::numeric_limits<Float>::infinity() : std::numeric_limits<Float>::infinity();
        }
        return res;
    }

    if (*next == 'n' || *next == 'N')
    {
        auto const res = ParseNaN(next, last);
        if (res.status != StrtodStatus::invalid)
        {
            value = std::numeric_limits<Float>::quiet_NaN();
        }
        return res;
    }

    return {next, StrtodStatus::invalid};
}

template <typename Float>
static StrtodResult StrtodImpl(int radix, char const* next, char const* last, Float& value)
{
    using radix_conv::IsDigit;

    char const* const start = next;

    if (radix < 2 || radix > 36)
        return {start, StrtodStatus::invalid};

    if (next == last)
        return {start, StrtodStatus::invalid};

    bool const is_negative = (*next == '-');
    if (is_negative || *next == '+')
    {
        ++next;
        if (next == last)
            return {start, StrtodStatus::invalid};
    }

    if (!IsDigit(*next, radix))
    {
        if (*next != '.')
        {
            auto const res = ParseSpecial(is_negative, next, last, value);
            if (res.status == StrtodStatus::invalid)
                return {start, StrtodStatus::invalid};
            return res;
        }

        // A numeral must contain at least one digit.
        if (last - next < 2 || !IsDigit(next[1], radix))
            return {start, StrtodStatus::invalid};
    }

    auto const res = radix_conv::impl::ToNative<Float>(radix, next, last);

    value = is_negative ? -res.value : res.value;
    return {res.next, StrtodStatus::number};
}

StrtodResult radix_conv::Strtod(int radix, char const* next, char const* last, double& value)
{
    return StrtodImpl(radix, next, last, value);
}

StrtodResult radix_conv::Strtof(int radix, char const* next, char const* last, float& value)
{
    return StrtodImpl(radix, next, last, value);
}

double radix_conv::DigitsToDouble(int radix, char const* first, char const* last)
{
    double value = std::numeric_limits<double>::quiet_NaN();
    if (!Strtod(radix, first, last, value))
        return std::numeric_limits<double>::quiet_NaN();

    return value;
}

float radix_conv::DigitsToFloat(int radix, char const* first, char const* last)
{
    float value = std::numeric_limits<float>::quiet_NaN();
    if (!Strtof(radix, first, last, value))
        return std::numeric_limits<float>::quiet_NaN();

    return value;
}
