// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "diy_int.h"

#include "config.h"
#include "diy_fp.h"

#include <climits>
#include <cstddef>

using radix_conv::DiyInt;

static inline int Min(int x, int y) { return y < x ? y : x; }

static inline int Size(DiyInt const& x)
{
    return static_cast<int>(x.bigits.size());
}

// Returns the bigit at the absolute position i, i.e. the coefficient of 2^(BigitSize * i).
static inline uint32_t GetBigit(DiyInt const& x, int i)
{
    int const k = i - x.exponent;
    return (k >= 0 && k < Size(x)) ? x.bigits[static_cast<size_t>(k)] : 0;
}

static inline void Trim(DiyInt& x)
{
    while (!x.bigits.empty() && x.bigits.back() == 0)
    {
        x.bigits.pop_back();
    }

    if (x.bigits.empty())
    {
        x.exponent = 0;
    }
}

void radix_conv::AssignZero(DiyInt& x)
{
    x.bigits.clear();
    x.exponent = 0;
}

void radix_conv::AssignU64(DiyInt& x, uint64_t value)
{
    AssignZero(x);

    if (value == 0)
        return;

    x.bigits.push_back(static_cast<uint32_t>(value));
    if ((value >> DiyInt::BigitSize) != 0)
    {
        x.bigits.push_back(static_cast<uint32_t>(value >> DiyInt::BigitSize));
    }
}

void radix_conv::MulAddU32(DiyInt& x, uint32_t A, uint32_t B)
{
    RADIX_CONV_ASSERT(B == 0 || x.exponent == 0);

    if (A == 1 && B == 0)
    {
        return;
    }
    if (A == 0 || IsZero(x))
    {
        AssignU64(x, B);
        return;
    }

    uint32_t carry = B;
    for (auto& bigit : x.bigits)
    {
        uint64_t const p = uint64_t{bigit} * A + carry;
        bigit            = static_cast<uint32_t>(p);
        carry            = static_cast<uint32_t>(p >> DiyInt::BigitSize);
    }

    if (carry != 0)
    {
        x.bigits.push_back(carry);
    }
}

void radix_conv::MulPow2(DiyInt& x, int exp) // aka left-shift
{
    RADIX_CONV_ASSERT(exp >= 0);

    if (IsZero(x))
        return;
    if (exp == 0)
        return;

    int const bigit_shift = exp / DiyInt::BigitSize;
    int const bit_shift   = exp % DiyInt::BigitSize;

    if (bit_shift > 0)
    {
        uint32_t carry = 0;
        for (auto& bigit : x.bigits)
        {
            uint32_t const h = bigit >> (DiyInt::BigitSize - bit_shift);
            bigit            = bigit << bit_shift | carry;
            carry            = h;
        }

        if (carry != 0)
        {
            x.bigits.push_back(carry);
        }
    }

    RADIX_CONV_ASSERT(x.exponent <= INT_MAX - bigit_shift);
    x.exponent += bigit_shift;
}

void radix_conv::MulPow(DiyInt& x, uint32_t base, int exp)
{
    RADIX_CONV_ASSERT(base >= 2);
    RADIX_CONV_ASSERT(exp >= 0);

    if (IsZero(x))
        return;

    // Multiply by the largest power of base which fits into a bigit, as often as possible.
    uint32_t max_pow = base;
    int      max_n   = 1;
    while (uint64_t{max_pow} * base <= UINT32_MAX)
    {
        max_pow *= base;
        ++max_n;
    }

    for ( ; exp >= max_n; exp -= max_n)
    {
        MulAddU32(x, max_pow);
    }

    if (exp > 0)
    {
        uint32_t p = 1;
        for ( ; exp > 0; --exp)
        {
            p *= base;
        }
        MulAddU32(x, p);
    }
}

void radix_conv::Subtract(DiyInt& x, DiyInt const& y)
{
    RADIX_CONV_ASSERT(Compare(x, y) >= 0);

    // Make the bigits of x absolute, such that they can be indexed like the bigits of y.
    if (x.exponent > 0)
    {
        x.bigits.insert(x.bigits.begin(), static_cast<size_t>(x.exponent), uint32_t{0});
        x.exponent = 0;
    }

    if (IsZero(y))
        return;

    int const ny = Size(y) + y.exponent;

    uint32_t borrow = 0;
    for (int i = 0; i < Size(x) && (i < ny || borrow != 0); ++i)
    {
        uint64_t const d = uint64_t{x.bigits[static_cast<size_t>(i)]} - GetBigit(y, i) - borrow;
        x.bigits[static_cast<size_t>(i)] = static_cast<uint32_t>(d);
        borrow = static_cast<uint32_t>(d >> 63);
    }

    RADIX_CONV_ASSERT(borrow == 0);
    Trim(x);
}

int radix_conv::Compare(DiyInt const& lhs, DiyInt const& rhs)
{
    int const e1 = lhs.exponent;
    int const e2 = rhs.exponent;
    int const n1 = Size(lhs) + e1;
    int const n2 = Size(rhs) + e2;

    if (n1 < n2) return -1;
    if (n1 > n2) return +1;

    for (int i = n1 - 1; i >= Min(e1, e2); --i)
    {
        uint32_t const b1 = GetBigit(lhs, i);
        uint32_t const b2 = GetBigit(rhs, i);

        if (b1 < b2) return -1;
        if (b1 > b2) return +1;
    }

    return 0;
}

int radix_conv::BitLength(DiyInt const& x)
{
    if (IsZero(x))
        return 0;

    int const top = Size(x) - 1 + x.exponent;
    return top * DiyInt::BigitSize + BitLength64(x.bigits.back());
}

uint64_t radix_conv::ExtractBits64(DiyInt const& x, int n)
{
    RADIX_CONV_ASSERT(n >= 0);

    int const w = n / DiyInt::BigitSize;
    int const s = n % DiyInt::BigitSize;

    uint64_t const lo = uint64_t{GetBigit(x, w)} | uint64_t{GetBigit(x, w + 1)} << 32;
    if (s == 0)
        return lo;

    uint64_t const hi = GetBigit(x, w + 2);
    return (lo >> s) | (hi << (64 - s));
}

bool radix_conv::HasBitsBelow(DiyInt const& x, int n)
{
    RADIX_CONV_ASSERT(n >= 0);

    int const w = n / DiyInt::BigitSize;
    int const s = n % DiyInt::BigitSize;

    for (int i = x.exponent; i < w; ++i)
    {
        if (GetBigit(x, i) != 0)
            return true;
    }

    return s != 0 && (GetBigit(x, w) & ((uint32_t{1} << s) - 1)) != 0;
}
