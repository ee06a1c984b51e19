// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstdint>
#include <vector>

namespace radix_conv {

struct DiyInt // bigits * 2^(BigitSize * exponent)
{
    static constexpr int BigitSize = 32;

    std::vector<uint32_t> bigits; // Significand stored in little-endian form. No leading zero bigits.
    int exponent = 0;
};

inline bool IsZero(DiyInt const& x)
{
    return x.bigits.empty();
}

void AssignZero(DiyInt& x);

void AssignU64(DiyInt& x, uint64_t value);

// x := A * x + B
// PRE: B == 0 or x.exponent == 0
void MulAddU32(DiyInt& x, uint32_t A, uint32_t B = 0);

// x := x * 2^exp
void MulPow2(DiyInt& x, int exp);

// x := x * base^exp
void MulPow(DiyInt& x, uint32_t base, int exp);

// x := x - y
// PRE: x >= y
// POST: x.exponent == 0
void Subtract(DiyInt& x, DiyInt const& y);

// Returns -1, 0, +1 if lhs <, ==, > rhs.
int Compare(DiyInt const& lhs, DiyInt const& rhs);

// Returns the number of significant bits in x.
int BitLength(DiyInt const& x);

// Returns bits [n, n + 64) of x.
uint64_t ExtractBits64(DiyInt const& x, int n);

// Returns whether any of the bits [0, n) of x is set.
bool HasBitsBelow(DiyInt const& x, int n);

} // namespace radix_conv
