// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "config.h"
#include "diy_fp.h"

#include <cstdint>
#include <cstring>
#include <limits>
#include <type_traits>

namespace radix_conv {

template <typename Dest, typename Source>
inline Dest ReinterpretBits(Source source)
{
    static_assert(sizeof(Dest) == sizeof(Source), "size mismatch");

    Dest dest;
    std::memcpy(&dest, &source, sizeof(Source));
    return dest;
}

// Returns log_2(radix) if radix is a power of 2, and 0 otherwise.
inline int Pow2Exponent(int radix)
{
    switch (radix)
    {
    case 2:  return 1;
    case 4:  return 2;
    case 8:  return 3;
    case 16: return 4;
    case 32: return 5;
    default: return 0;
    }
}

struct ExponentLimits {
    int min;
    int max;
};

template <typename Float>
struct IEEE
{
    // NB:
    // Works for double == long double.
    static_assert(std::numeric_limits<Float>::is_iec559 &&
                  ((std::numeric_limits<Float>::digits == 24 && std::numeric_limits<Float>::max_exponent == 128) ||
                   (std::numeric_limits<Float>::digits == 53 && std::numeric_limits<Float>::max_exponent == 1024)),
        "IEEE-754 single- or double-precision implementation required");

    using ieee_type = Float;
    using bits_type = typename std::conditional<std::numeric_limits<Float>::digits == 24, uint32_t, uint64_t>::type;

    static constexpr int       SignificandSize         = std::numeric_limits<ieee_type>::digits;  // = p   (includes the hidden bit)
    static constexpr int       PhysicalSignificandSize = SignificandSize - 1;                     // = p-1 (excludes the hidden bit)
    static constexpr int       UnbiasedMinExponent     = 1;
    static constexpr int       UnbiasedMaxExponent     = 2 * std::numeric_limits<Float>::max_exponent - 1 - 1;
    static constexpr int       ExponentBias            = 2 * std::numeric_limits<Float>::max_exponent / 2 - 1 + (SignificandSize - 1);
    static constexpr int       MinExponent             = UnbiasedMinExponent - ExponentBias;
    static constexpr int       MaxExponent             = UnbiasedMaxExponent - ExponentBias;
    static constexpr bits_type HiddenBit               = bits_type{1} << (SignificandSize - 1);   // = 2^(p-1)
    static constexpr bits_type SignificandMask         = HiddenBit - 1;                           // = 2^(p-1) - 1
    static constexpr bits_type ExponentMask            = bits_type{2 * std::numeric_limits<Float>::max_exponent - 1} << PhysicalSignificandSize;
    static constexpr bits_type SignMask                = ~(~bits_type{0} >> 1);

    bits_type bits;

    explicit IEEE(bits_type bits_) : bits(bits_) {}
    explicit IEEE(ieee_type value) : bits(ReinterpretBits<bits_type>(value)) {}

    bits_type PhysicalSignificand() const {
        return bits & SignificandMask;
    }

    bits_type PhysicalExponent() const {
        return (bits & ExponentMask) >> PhysicalSignificandSize;
    }

    bool IsFinite() const {
        return (bits & ExponentMask) != ExponentMask;
    }

    bool IsInf() const {
        return (bits & ExponentMask) == ExponentMask && (bits & SignificandMask) == 0;
    }

    bool SignBit() const {
        return (bits & SignMask) != 0;
    }

    ieee_type NextValue() const {
        RADIX_CONV_ASSERT(!SignBit());
        return ReinterpretBits<ieee_type>(IsInf() ? bits : bits + 1);
    }

    // Returns the range [min, max] of exponents k for which mantissa * radix^k can be computed
    // without rounding error (other than the final rounding).
    //
    // For powers of 2 this is the range of binary exponents of the type, scaled by 1/log_2(radix).
    // Otherwise it is [-k, k] where radix^k is the largest power which is exactly representable.
    static ExponentLimits ExponentLimit(int radix)
    {
        RADIX_CONV_ASSERT(radix >= 2);
        RADIX_CONV_ASSERT(radix <= 36);

        int const pow2_exp = Pow2Exponent(radix);
        if (pow2_exp != 0)
        {
            int const max_binary_exponent = MaxExponent + PhysicalSignificandSize;
            return {MinExponent / pow2_exp, max_binary_exponent / pow2_exp};
        }

        // radix^k is exactly representable iff its odd part fits into the significand.
        uint64_t odd = static_cast<uint64_t>(radix);
        while ((odd & 1) == 0)
        {
            odd >>= 1;
        }

        int k = 0;
        for (uint64_t p = odd; p < (uint64_t{1} << SignificandSize); p *= odd)
        {
            ++k;
        }

        return {-k, k};
    }

    // Returns radix^k.
    // PRE: 0 <= k <= ExponentLimit(radix).max
    static ieee_type ExactPower(int radix, int k)
    {
        RADIX_CONV_ASSERT(k >= 0);
        RADIX_CONV_ASSERT(k <= ExponentLimit(radix).max);

        ieee_type const r = static_cast<ieee_type>(radix);

        ieee_type p = 1;
        for ( ; k > 0; --k)
        {
            p *= r; // exact
        }

        return p;
    }
};

// Returns the number of low-order bits which must be discarded when converting the normalized
// extended-precision value f * 2^e into the IEEE type.
// This is 64 - p, unless the result is subnormal. In this case more bits are discarded.
template <typename Float>
inline int ExcessBits(int e)
{
    using Fp = IEEE<Float>;

    int const normal_bits = DiyFp::SignificandSize - Fp::SignificandSize;
    int const subnormal_bits = Fp::MinExponent - e;

    return subnormal_bits > normal_bits ? subnormal_bits : normal_bits;
}

enum class Rounding {
    nearest_even,
    toward_zero,
};

// Returns f * 2^e, rounded to the IEEE type.
//
// Rounding is performed exactly once, on the integer significand, so that subnormal results are
// correctly rounded, too.
// Values too large for the type round to +Infinity (nearest_even) or to the maximum finite
// value (toward_zero).
template <typename Float>
inline Float LoadFloat(DiyFp x, Rounding mode = Rounding::nearest_even)
{
    using Fp = IEEE<Float>;
    using bits_type = typename Fp::bits_type;

    if (x.f == 0)
    {
        return Float(0);
    }

    x = Normalize(x);

    int const excess_bits = ExcessBits<Float>(x.e);
    RADIX_CONV_ASSERT(excess_bits > 0);

    if (excess_bits > 64)
    {
        // x < 2^(64 + e) <= 2^(MinExponent - 1), i.e. less than half of the smallest subnormal.
        return Float(0);
    }

    uint64_t q;
    bool round_up;
    if (excess_bits == 64)
    {
        q = 0;
        round_up = mode == Rounding::nearest_even && x.f > (uint64_t{1} << 63);
    }
    else
    {
        uint64_t const half = uint64_t{1} << (excess_bits - 1);
        uint64_t const rem  = x.f & ((uint64_t{1} << excess_bits) - 1);

        q = x.f >> excess_bits;
        round_up = mode == Rounding::nearest_even && (rem > half || (rem == half && (q & 1) != 0));
    }

    q += round_up ? 1 : 0;
    int e = x.e + excess_bits;

    // Rounding up may overflow the p-bit significand.
    // But in this case the significand is 2^p and we don't loose any bits by normalizing.
    if (q > Fp::HiddenBit + Fp::SignificandMask)
    {
        RADIX_CONV_ASSERT(q == (uint64_t{Fp::HiddenBit} << 1));
        q >>= 1;
        e  += 1;
    }

    if (e > Fp::MaxExponent)
    {
        return mode == Rounding::nearest_even
            ? std::numeric_limits<Float>::infinity()
            : std::numeric_limits<Float>::max();
    }

    RADIX_CONV_ASSERT(e >= Fp::MinExponent);
    RADIX_CONV_ASSERT(e == Fp::MinExponent || (q & Fp::HiddenBit) != 0);

    bits_type const significand = static_cast<bits_type>(q);
    bits_type const exponent = (e == Fp::MinExponent && (significand & Fp::HiddenBit) == 0)
        ? 0 // subnormal
        : static_cast<bits_type>(e + Fp::ExponentBias);

    bits_type const bits = (exponent << Fp::PhysicalSignificandSize) | (significand & Fp::SignificandMask);

    return ReinterpretBits<Float>(bits);
}

// Decomposes `value` into `f * 2^e`.
// The result is not normalized.
// PRE: `value` must be finite and non-negative, i.e. >= +0.0.
template <typename Float>
inline DiyFp DiyFpFromFloat(Float value)
{
    using Fp = IEEE<Float>;

    auto const v = Fp(value);

    RADIX_CONV_ASSERT(v.IsFinite());
    RADIX_CONV_ASSERT(!v.SignBit());

    auto const F = v.PhysicalSignificand();
    auto const E = v.PhysicalExponent();

    // If v is denormal:
    //      value = 0.F * 2^(1 - bias) = (          F) * 2^(1 - bias - (p-1))
    // If v is normalized:
    //      value = 1.F * 2^(E - bias) = (2^(p-1) + F) * 2^(E - bias - (p-1))

    return (E == 0) // denormal?
        ? DiyFp(F, Fp::MinExponent)
        : DiyFp(F + Fp::HiddenBit, static_cast<int>(E) - Fp::ExponentBias);
}

// Returns the upper boundary of value, i.e. the upper bound of the rounding
// interval for v: m+ = (v + v+) / 2.
// The result is not normalized.
// PRE: `value` must be finite and non-negative.
template <typename Float>
inline DiyFp UpperBoundary(Float value)
{
    auto const v = DiyFpFromFloat(value);
    return DiyFp(2*v.f + 1, v.e - 1);
}

// Returns whether the significand f of v = f * 2^e is even.
template <typename Float>
inline bool SignificandIsEven(Float v)
{
    return (IEEE<Float>(v).PhysicalSignificand() & 1) == 0;
}

} // namespace radix_conv
