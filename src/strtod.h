// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "config.h"
#include "digits.h"
#include "diy_fp.h"
#include "ieee.h"
#include "powers.h"

#include <climits>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace radix_conv {

//==================================================================================================
// Mantissa and exponent
//==================================================================================================

struct MantissaResult {
    uint64_t mantissa;
    int dot_shift; // Number of fractional digits folded into the mantissa, minus the number of digits which were not.
    char const* next;
    bool truncated;
};

// Accumulates the digits of [first, last) into a 64-bit mantissa.
//
// Leading zeros are skipped. Once the mantissa would overflow, the remaining digits are only
// scanned and the mantissa is marked as truncated.
// A '.' is consumed only if it is followed by at least one more character.
//
// PRE: first != last
// PRE: 2 <= radix <= 36
MantissaResult ParseMantissa(int radix, char const* first, char const* last);

// Returns exponent - dot_shift.
// INT_MAX and INT_MIN are sentinels for exponents out of range: they are returned unchanged.
// Other results saturate at INT_MAX and INT_MIN.
int CombineExponent(int exponent, int dot_shift);

struct NormalizedMantissa {
    uint64_t mantissa;
    int exponent;
};

// Removes trailing factors of the radix from the mantissa and moves them into the exponent.
// A zero mantissa is returned unchanged.
NormalizedMantissa NormalizeMantissa(uint64_t mantissa, int radix, int exponent);

struct FloatComponents {
    uint64_t mantissa;
    int exponent;
    char const* next;
    bool truncated;
};

// Decomposes [first, last) into mantissa * radix^exponent.
// The exponent combines the exponent literal (if any) and the position of the '.'.
//
// PRE: first != last
// PRE: 2 <= radix <= 36
FloatComponents ParseFloatComponents(int radix, char const* first, char const* last);

//==================================================================================================
// Conversion
//==================================================================================================

template <typename Float>
struct AtofResult {
    Float value;
    char const* next;
};

namespace impl {

//--------------------------------------------------------------------------------------------------
// Exact conversions
//--------------------------------------------------------------------------------------------------

// Computes mantissa * 2^(pow2_exp * exponent), which only requires a single (integer) rounding
// step.
//
// If the mantissa has been truncated, the exact value lies in
// [mantissa, mantissa + 1) * 2^(pow2_exp * exponent). This is only a problem if the computed
// value is exactly halfway between two floating-point numbers.
// Returns false in this case.
template <typename Float>
inline bool Pow2ToExact(Float& result, uint64_t mantissa, int pow2_exp, int exponent, bool truncated)
{
    using Fp = IEEE<Float>;

    RADIX_CONV_ASSERT(mantissa != 0);
    RADIX_CONV_ASSERT(pow2_exp >= 1);
    RADIX_CONV_ASSERT(pow2_exp <= 5);

    auto const limits = Fp::ExponentLimit(1 << pow2_exp);

    if (exponent > limits.max)
    {
        // value >= 2^(pow2_exp * (max + 1)) >= 2^(MaxExponent + p)
        result = std::numeric_limits<Float>::infinity();
        return true;
    }

    // value < 2^64 * 2^(pow2_exp * exponent) < 2^(64 + MinExponent - 65)
    if (exponent < limits.min - (65 + pow2_exp - 1) / pow2_exp)
    {
        result = Float(0);
        return true;
    }

    DiyFp const x = Normalize(DiyFp(mantissa, pow2_exp * exponent));

    if (truncated)
    {
        // The dropped digits add less than one unit of the mantissa and less than 2^-58 of its
        // value. So they never carry into the bits above the rounding position, but may turn an
        // exact tie into a value above the halfway point.
        int const excess_bits = ExcessBits<Float>(x.e);
        if (excess_bits == 64 && x.f == (uint64_t{1} << 63))
            return false;
        if (excess_bits < 64 && (x.f & ((uint64_t{1} << excess_bits) - 1)) == (uint64_t{1} << (excess_bits - 1)))
            return false;
    }

    result = LoadFloat<Float>(x);
    return true;
}

#if RADIX_CONV_CORRECT_FLOAT_OPERATIONS

// Computes mantissa * radix^exponent using a single floating-point multiplication or division.
// This is correctly rounded if both operands are exactly representable.
// Returns false otherwise.
//
// PRE: radix is not a power of 2.
template <typename Float>
inline bool ToExact(Float& result, uint64_t mantissa, int radix, int exponent)
{
    using Fp = IEEE<Float>;

    RADIX_CONV_ASSERT(Pow2Exponent(radix) == 0);

    if ((mantissa >> Fp::SignificandSize) != 0)
        return false;

    Float const value = static_cast<Float>(mantissa); // exact

    if (exponent == 0)
    {
        result = value;
        return true;
    }

    auto const limits = Fp::ExponentLimit(radix);
    if (exponent < limits.min || exponent > limits.max)
        return false;

    if (exponent > 0)
        result = value * Fp::ExactPower(radix, exponent);
    else
        result = value / Fp::ExactPower(radix, -exponent);

    return true;
}

#else // ^^^ RADIX_CONV_CORRECT_FLOAT_OPERATIONS

template <typename Float>
inline bool ToExact(Float& /*result*/, uint64_t /*mantissa*/, int /*radix*/, int /*exponent*/)
{
    return false;
}

#endif // ^^^ !RADIX_CONV_CORRECT_FLOAT_OPERATIONS

//--------------------------------------------------------------------------------------------------
// Extended-precision conversion
//--------------------------------------------------------------------------------------------------

// Errors are counted in 1/kErrorScale ULP.
// The ambiguity test compares the count with the extra bits in ULP, which is conservative.
constexpr uint32_t kErrorScale = 8;
constexpr uint32_t kErrorHalfScale = kErrorScale / 2;

// Bound for the error of a truncated mantissa after normalization.
// Before its trailing zeros have been removed, a truncated mantissa has more than 58 bits. So the
// relative error due to truncation is less than 2^-58, i.e. less than 2^6 ULP.
constexpr uint32_t kTruncationErrors = 64;

inline DiyFp NormalizeWithErrors(DiyFp x, uint32_t& errors)
{
    int const shift = CountLeadingZeros64(x.f);
    errors <<= shift;
    return DiyFp(x.f << shift, x.e - shift);
}

// Returns whether the bits of x which do not fit into the significand of Float are far enough from
// the halfway point, such that rounding x is not affected by the errors.
// PRE: x is normalized
template <typename Float>
inline bool IsTrusted(DiyFp x, uint32_t errors)
{
    RADIX_CONV_ASSERT(IsNormalized(x));

    if (errors == 0)
        return true;

    int const extra_bits = ExcessBits<Float>(x.e);

    // x + errors < 2^65 * 2^e <= 2^(MinExponent - 1)
    // i.e. x rounds to zero.
    if (extra_bits > 65)
        return true;

    // halfway = 2^64
    if (extra_bits == 65)
        return x.f <= 0 - uint64_t{errors};

    uint64_t const halfway = uint64_t{1} << (extra_bits - 1);
    uint64_t const mask = (extra_bits == 64) ? ~uint64_t{0} : (uint64_t{1} << extra_bits) - 1;
    uint64_t const extra = x.f & mask;

    // Ambiguous iff halfway - errors < extra < halfway + errors
    uint64_t const distance = (extra >= halfway) ? extra - halfway : halfway - extra;
    return distance >= errors;
}

// Computes mantissa * radix^exponent using 64-bit extended-precision arithmetic.
//
// Returns true if the result is correctly rounded.
// Otherwise the result is either the correctly rounded value or its predecessor.
template <typename Float>
inline bool ToExtended(Float& result, uint64_t mantissa, int radix, int exponent, bool truncated)
{
    RADIX_CONV_ASSERT(mantissa != 0);

    PowerTable const& powers = GetPowerTable(radix);

    if (exponent < -powers.bias)
    {
        // Guaranteed underflow.
        result = Float(0);
        return true;
    }

    if (exponent > INT_MAX - powers.bias)
    {
        // Guaranteed overflow.
        result = std::numeric_limits<Float>::infinity();
        return true;
    }

    int const biased_exponent = exponent + powers.bias;
    int const small_index = biased_exponent % powers.step;
    int const large_index = biased_exponent / powers.step;

    if (large_index >= static_cast<int>(powers.large.size()))
    {
        // Guaranteed overflow.
        result = std::numeric_limits<Float>::infinity();
        return true;
    }

    uint32_t errors = 0;

    // Multiply by the small power.
    // If the product fits into 64 bits, it is exact.

    DiyFp x(mantissa, 0);

    uint64_t product;
    bool const product_is_exact = MultiplyU64(product, mantissa, powers.small_int[static_cast<size_t>(small_index)]);
    if (product_is_exact)
    {
        x.f = product;
    }

    x = Normalize(x);
    if (truncated)
    {
        errors = kTruncationErrors;
    }

    if (!product_is_exact)
    {
        x = Multiply(x, powers.small[static_cast<size_t>(small_index)]);
        errors += kErrorHalfScale;
        x = NormalizeWithErrors(x, errors);
    }

    // Multiply by the large power.

    x = Multiply(x, powers.large[static_cast<size_t>(large_index)]);
    errors += (errors > 0) ? 1 : 0;
    errors += kErrorHalfScale;
    x = NormalizeWithErrors(x, errors);

    bool const trusted = IsTrusted<Float>(x, errors);

    result = LoadFloat<Float>(x, trusted ? Rounding::nearest_even : Rounding::toward_zero);
    return trusted;
}

//--------------------------------------------------------------------------------------------------
// Arbitrary-precision conversion
//--------------------------------------------------------------------------------------------------

// Maximum number of significant digits required for an even radix.
//
// For an even radix, every value (2f + 1) * 2^(e - 1) halfway between two double-precision
// numbers has a finite representation with at most 875 significant digits (radix 34).
// If the first digits of an input are equal to the digits of such a halfway point, the input
// must be rounded up unless the tail consists of zeros. So the rest of the digits may be replaced
// by a single non-zero digit.
//
// For an odd radix, the halfway points have infinite representations and all digits are
// required.
constexpr int kMaxSignificantDigitsEven = 1100;

// Compares the value of the numeral [first, last) with v = f * 2^e.
// Returns -1, 0, +1 if the numeral is less than, equal to, greater than v.
//
// PRE: [first, last) is a complete numeral, as accepted by ParseFloatComponents.
// PRE: The mantissa of the numeral is not 0.
int CompareDigitsWithDiyFp(int radix, char const* first, char const* last, DiyFp v);

// Returns the correctly rounded value of the numeral [first, last).
//
// PRE: candidate is either the correctly rounded value or its predecessor.
template <typename Float>
RADIX_CONV_NEVER_INLINE Float SlowPath(int radix, char const* first, char const* last, Float candidate)
{
    // Compare the exact value B = digits * radix^exponent with the upper boundary m+ of the
    // candidate v.
    //
    //     v             m+            v+
    //  ---+--------+----+-------------+---
    //              B

    int const cmp = CompareDigitsWithDiyFp(radix, first, last, UpperBoundary(candidate));
    if (cmp < 0 || (cmp == 0 && SignificandIsEven(candidate)))
    {
        return candidate;
    }

    return IEEE<Float>(candidate).NextValue();
}

//--------------------------------------------------------------------------------------------------
// Dispatcher
//--------------------------------------------------------------------------------------------------

// PRE: [first, last) starts with a non-negative, non-special numeral.
template <typename Float>
inline AtofResult<Float> ToNative(int radix, char const* first, char const* last)
{
    auto const components = ParseFloatComponents(radix, first, last);

    if (components.mantissa == 0)
    {
        // No digits have been truncated, since leading zeros are skipped.
        return {Float(0), components.next};
    }

    Float value;

    int const pow2_exp = Pow2Exponent(radix);
    if (pow2_exp != 0)
    {
        if (Pow2ToExact(value, components.mantissa, pow2_exp, components.exponent, components.truncated))
            return {value, components.next};
    }
    else if (!components.truncated)
    {
        if (ToExact(value, components.mantissa, radix, components.exponent))
            return {value, components.next};
    }

    if (ToExtended(value, components.mantissa, radix, components.exponent, components.truncated))
        return {value, components.next};

    return {SlowPath(radix, first, components.next, value), components.next};
}

} // namespace impl

// Converts the numeral at the start of [first, last) into the nearest single-precision number.
//
// PRE: first != last
// PRE: 2 <= radix <= 36
// PRE: [first, last) starts with a non-negative, non-special numeral.
AtofResult<float> Atof(int radix, char const* first, char const* last);

// Converts the numeral at the start of [first, last) into the nearest double-precision number.
//
// PRE: first != last
// PRE: 2 <= radix <= 36
// PRE: [first, last) starts with a non-negative, non-special numeral.
AtofResult<double> Atod(int radix, char const* first, char const* last);

} // namespace radix_conv
