// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "diy_fp.h"

#include <cstdint>
#include <vector>

namespace radix_conv {

//==================================================================================================
// Powers of the radix
//
// radix^k, for k = biased_k - bias, is split into
//
//      radix^k = small[biased_k % step] * large[biased_k / step]
//
// where small[i] = radix^i and large[j] = radix^(j * step - bias).
//
// The small powers are exact (they fit into 32 bits). The large powers are rounded to nearest,
// i.e. have an error of at most 1/2 ULP.
//==================================================================================================

// Minimum binary exponent of radix^bias. Any mantissa < 2^64 multiplied by radix^-bias (or
// less) is less than 2^(64 - 1139) = 2^-1075, i.e. less than half of the smallest subnormal double.
constexpr int kPowerTableMinBinaryExponent = 1139;

// Maximum binary length of the large powers. Any mantissa >= 1 multiplied by a larger power of
// the radix is >= 2^1024, i.e. overflows.
constexpr int kPowerTableMaxBitLength = 1024;

struct PowerTable
{
    int radix = 0;
    int step = 0;
    int bias = 0;
    std::vector<uint64_t> small_int; // radix^i, 0 <= i < step
    std::vector<DiyFp> small;        // radix^i, 0 <= i < step, normalized
    std::vector<DiyFp> large;        // radix^(i * step - bias), normalized
};

// Returns the (cached) power table for the given radix.
// The tables are computed on first use. Safe to call from multiple threads.
// PRE: 2 <= radix <= 36
PowerTable const& GetPowerTable(int radix);

// Returns radix^k, normalized and rounded to nearest (ties-to-even).
// PRE: 2 <= radix <= 36
DiyFp ComputePower(int radix, int k);

} // namespace radix_conv
