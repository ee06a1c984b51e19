// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "strtod.h"

#include "diy_int.h"

#include <cstddef>
#include <vector>

using namespace radix_conv;

//==================================================================================================
// Mantissa and exponent
//==================================================================================================

MantissaResult radix_conv::ParseMantissa(int radix, char const* first, char const* last)
{
    RADIX_CONV_ASSERT(first != last);
    RADIX_CONV_ASSERT(radix >= 2);
    RADIX_CONV_ASSERT(radix <= 36);

    // Skip leading zeros. These never contribute to the mantissa, and skipping them makes sure that
    // only significant digits are counted as truncated.
    char const* p = SkipZeros(first, last);

    uint64_t mantissa = 0;
    auto const int_part = ParseDigitsChecked(mantissa, radix, p, last);
    p = int_part.next;

    bool const has_fraction = (last - p) >= 2 && *p == '.';

    if (has_fraction && int_part.truncated == 0)
    {
        ++p;
        char const* const fraction_first = p;

        if (mantissa == 0)
        {
            // Leading zeros of the fractional part only move the '.'.
            p = SkipZeros(p, last);
        }

        auto const fraction_part = ParseDigitsChecked(mantissa, radix, p, last);
        p = fraction_part.next;

        int const dot_shift = SaturatingIntFromSize(p - fraction_first) - SaturatingIntFromSize(fraction_part.truncated);
        return {mantissa, dot_shift, p, fraction_part.truncated != 0};
    }

    if (has_fraction)
    {
        // The integer part has already been truncated.
        // Skip the fractional digits. They don't change the position of the '.'.
        ++p;
        for ( ; p != last && IsDigit(*p, radix); ++p)
        {
        }
    }

    return {mantissa, -SaturatingIntFromSize(int_part.truncated), p, int_part.truncated != 0};
}

static int AddToExponent(int exponent, int n)
{
    if (exponent == INT_MAX || exponent == INT_MIN)
        return exponent;

    return SaturatingAdd(exponent, n);
}

int radix_conv::CombineExponent(int exponent, int dot_shift)
{
    if (exponent == INT_MAX || exponent == INT_MIN)
        return exponent;

    return SaturatingSub(exponent, dot_shift);
}

NormalizedMantissa radix_conv::NormalizeMantissa(uint64_t mantissa, int radix, int exponent)
{
    RADIX_CONV_ASSERT(radix >= 2);
    RADIX_CONV_ASSERT(radix <= 36);

    if (mantissa == 0)
        return {mantissa, exponent};

    uint64_t const radix1 = static_cast<uint64_t>(radix);
    uint64_t const radix2 = radix1 * radix1;
    uint64_t const radix4 = radix2 * radix2;

    while (mantissa % radix4 == 0)
    {
        mantissa /= radix4;
        exponent = AddToExponent(exponent, 4);
    }
    while (mantissa % radix2 == 0)
    {
        mantissa /= radix2;
        exponent = AddToExponent(exponent, 2);
    }
    if (mantissa % radix1 == 0)
    {
        mantissa /= radix1;
        exponent = AddToExponent(exponent, 1);
    }

    return {mantissa, exponent};
}

FloatComponents radix_conv::ParseFloatComponents(int radix, char const* first, char const* last)
{
    auto const m = ParseMantissa(radix, first, last);
    auto const e = ParseExponent(radix, m.next, last);

    int const exponent = CombineExponent(e.exponent, m.dot_shift);

    auto const n = NormalizeMantissa(m.mantissa, radix, exponent);

    return {n.mantissa, n.exponent, e.next, m.truncated};
}

//==================================================================================================
// Arbitrary-precision comparison
//==================================================================================================

// Decomposes radix = 2^pow2 * odd, with odd an odd number.
static int SplitRadix(int radix, uint32_t& odd)
{
    int pow2 = 0;
    for ( ; (radix & 1) == 0; radix >>= 1)
    {
        ++pow2;
    }

    odd = static_cast<uint32_t>(radix);
    return pow2;
}

// D := D * radix^n + digits
static void AppendDigits(DiyInt& D, int radix, std::vector<uint32_t> const& digits)
{
    uint32_t const max_chunk = UINT32_MAX / static_cast<uint32_t>(radix);

    size_t i = 0;
    while (i < digits.size())
    {
        uint32_t scale = 1;
        uint32_t chunk = 0;
        for ( ; i < digits.size() && scale <= max_chunk; ++i)
        {
            scale = scale * static_cast<uint32_t>(radix);
            chunk = chunk * static_cast<uint32_t>(radix) + digits[i];
        }

        MulAddU32(D, scale, chunk);
    }
}

int impl::CompareDigitsWithDiyFp(int radix, char const* first, char const* last, DiyFp v)
{
    RADIX_CONV_ASSERT(radix >= 2);
    RADIX_CONV_ASSERT(radix <= 36);
    RADIX_CONV_ASSERT(v.f != 0);

    // Collect the significant digits.
    // The value of the numeral is digits * radix^exponent.

    std::vector<uint32_t> digits;
    int64_t exponent = 0;
    int64_t num_dropped = 0;
    bool nonzero_tail = false;

    bool const is_even = (radix % 2) == 0;
    bool in_fraction = false;

    char const* p = first;
    for ( ; p != last; ++p)
    {
        if (*p == '.' && !in_fraction && (last - p) >= 2)
        {
            in_fraction = true;
            continue;
        }

        uint32_t const d = CharToDigit(*p);
        if (d >= static_cast<uint32_t>(radix))
            break;

        if (in_fraction)
            --exponent;

        if (digits.empty() && d == 0)
            continue;

        if (is_even && digits.size() >= static_cast<size_t>(kMaxSignificantDigitsEven))
        {
            // Drop the digit, but keep track of its position and value.
            ++num_dropped;
            nonzero_tail = nonzero_tail || d != 0;
            continue;
        }

        digits.push_back(d);
    }

    RADIX_CONV_ASSERT(!digits.empty());

    auto const literal_exponent = ParseExponent(radix, p, last);
    exponent += literal_exponent.exponent;
    exponent += num_dropped;

    // Move trailing zeros into the exponent.
    // If digits have been dropped, the position of the last digit must be kept.
    if (!nonzero_tail)
    {
        while (digits.back() == 0)
        {
            digits.pop_back();
            ++exponent;
        }
    }

    DiyInt lhs;
    DiyInt rhs;

    AppendDigits(lhs, radix, digits);
    if (nonzero_tail)
    {
        MulAddU32(lhs, static_cast<uint32_t>(radix), 1);
        --exponent;
    }
    AssignU64(rhs, v.f);

    // Compare lhs * 2^(pow2 * exponent) * odd^exponent with rhs * 2^v.e

    uint32_t odd;
    int const pow2 = SplitRadix(radix, odd);

    int64_t lhs_exp2 = 0;
    int64_t rhs_exp2 = 0;

    if (exponent >= 0)
    {
        RADIX_CONV_ASSERT(exponent <= INT_MAX / 8);
        if (odd != 1)
        {
            MulPow(lhs, odd, static_cast<int>(exponent));
        }
        lhs_exp2 += pow2 * exponent;
    }
    else
    {
        RADIX_CONV_ASSERT(-exponent <= INT_MAX / 8);
        if (odd != 1)
        {
            MulPow(rhs, odd, static_cast<int>(-exponent));
        }
        rhs_exp2 -= pow2 * exponent;
    }

    if (v.e >= 0)
    {
        rhs_exp2 += v.e;
    }
    else
    {
        lhs_exp2 -= v.e;
    }

    int64_t const diff_exp2 = lhs_exp2 - rhs_exp2;
    if (diff_exp2 != 0)
    {
        MulPow2((diff_exp2 > 0) ? lhs : rhs, static_cast<int>((diff_exp2 > 0) ? diff_exp2 : -diff_exp2));
    }

    return Compare(lhs, rhs);
}

//==================================================================================================
// Atof
//==================================================================================================

AtofResult<float> radix_conv::Atof(int radix, char const* first, char const* last)
{
    return impl::ToNative<float>(radix, first, last);
}

AtofResult<double> radix_conv::Atod(int radix, char const* first, char const* last)
{
    return impl::ToNative<double>(radix, first, last);
}
