// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "powers.h"

#include "config.h"
#include "diy_int.h"
#include "ieee.h"

#include <climits>
#include <mutex>

using namespace radix_conv;

static void AssignPower(DiyInt& x, int radix, int k)
{
    AssignU64(x, 1);
    MulPow(x, static_cast<uint32_t>(radix), k);
}

// Returns radix^k for k >= 0.
static DiyFp PositivePower(int radix, int k)
{
    DiyInt p;
    AssignPower(p, radix, k);

    int const length = BitLength(p);
    if (length <= 64)
    {
        return Normalize(DiyFp(ExtractBits64(p, 0), 0));
    }

    // Round to nearest, ties-to-even.
    int const n = length - 64;

    uint64_t   f          = ExtractBits64(p, n);
    bool const round_bit  = (ExtractBits64(p, n - 1) & 1) != 0;
    bool const sticky_bit = HasBitsBelow(p, n - 1);
    int        e          = n;

    if (round_bit && (sticky_bit || (f & 1) != 0))
    {
        ++f;
        if (f == 0) // carry out of the 64 bits
        {
            f = uint64_t{1} << 63;
            ++e;
        }
    }

    return DiyFp(f, e);
}

// Returns radix^-k for k > 0.
static DiyFp NegativePower(int radix, int k)
{
    int const pow2_exp = Pow2Exponent(radix);
    if (pow2_exp != 0)
    {
        return DiyFp(uint64_t{1} << 63, -pow2_exp * k - 63);
    }

    DiyInt p;
    AssignPower(p, radix, k);

    // Since p is not a power of 2: 2^(length - 1) < p < 2^length.
    // So q = 2^(length + 63) / p lies in (2^63, 2^64), and we compute it by long division.
    int const length = BitLength(p);

    DiyInt r;
    AssignU64(r, 1);
    MulPow2(r, length - 1);

    uint64_t q = 0;
    for (int i = 0; i < 64; ++i)
    {
        MulPow2(r, 1);
        q <<= 1;
        if (Compare(r, p) >= 0)
        {
            Subtract(r, p);
            q |= 1;
        }
    }

    RADIX_CONV_ASSERT(q >= (uint64_t{1} << 63));

    int e = -(length + 63);

    // Round to nearest.
    // The remainder is never exactly p/2, since p is not a power of 2.
    MulPow2(r, 1);
    if (Compare(r, p) > 0)
    {
        ++q;
        if (q == 0)
        {
            q = uint64_t{1} << 63;
            ++e;
        }
    }

    return DiyFp(q, e);
}

DiyFp radix_conv::ComputePower(int radix, int k)
{
    RADIX_CONV_ASSERT(radix >= 2);
    RADIX_CONV_ASSERT(radix <= 36);
    RADIX_CONV_ASSERT(k > INT_MIN);

    return k >= 0 ? PositivePower(radix, k) : NegativePower(radix, -k);
}

static void InitPowerTable(PowerTable& table, int radix)
{
    uint64_t const r = static_cast<uint64_t>(radix);

    // step = 1 + max{n : radix^n < 2^32}
    int n = 0;
    for (uint64_t p = r; p < (uint64_t{1} << 32); p *= r)
    {
        ++n;
    }
    int const step = n + 1;

    // bias = min{b : radix^b >= 2^kPowerTableMinBinaryExponent}
    DiyInt x;
    AssignU64(x, 1);
    int bias = 0;
    while (BitLength(x) <= kPowerTableMinBinaryExponent)
    {
        MulAddU32(x, static_cast<uint32_t>(radix));
        ++bias;
    }

    // max_k = max{k : radix^k < 2^kPowerTableMaxBitLength}
    AssignU64(x, 1);
    int max_k = 0;
    for (;;)
    {
        MulAddU32(x, static_cast<uint32_t>(radix));
        if (BitLength(x) > kPowerTableMaxBitLength)
            break;
        ++max_k;
    }

    table.radix = radix;
    table.step  = step;
    table.bias  = bias;

    uint64_t p = 1;
    for (int i = 0; i < step; ++i)
    {
        table.small_int.push_back(p);
        table.small.push_back(Normalize(DiyFp(p, 0)));
        p *= r;
    }

    int const num_large = (max_k + bias) / step + 1;
    for (int i = 0; i < num_large; ++i)
    {
        table.large.push_back(ComputePower(radix, i * step - bias));
    }
}

PowerTable const& radix_conv::GetPowerTable(int radix)
{
    RADIX_CONV_ASSERT(radix >= 2);
    RADIX_CONV_ASSERT(radix <= 36);

    static PowerTable tables[37];
    static std::once_flag flags[37];

    std::call_once(flags[radix], [radix] { InitPowerTable(tables[radix], radix); });

    return tables[radix];
}
