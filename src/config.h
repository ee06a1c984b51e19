// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cassert>

#ifndef RADIX_CONV_ASSERT
#define RADIX_CONV_ASSERT(X) assert(X)
#endif

#ifndef RADIX_CONV_NEVER_INLINE
#if _MSC_VER
#define RADIX_CONV_NEVER_INLINE __declspec(noinline) inline
#elif __GNUC__
#define RADIX_CONV_NEVER_INLINE __attribute__((noinline)) inline
#else
#define RADIX_CONV_NEVER_INLINE inline
#endif
#endif

// Floating-point operations detection based on target architecture.
// Linux uses a 80bit wide floating point stack on x86. This induces double rounding, which in
// turn leads to wrong results.
// An easy way to test if the floating-point operations are correct is to evaluate: 89255.0/1e22.
// If the floating-point stack is 64 bits wide then the result is equal to 89255e-22.
#ifndef RADIX_CONV_CORRECT_FLOAT_OPERATIONS
#if defined(_M_X64)              || \
    defined(__x86_64__)          || \
    defined(__ARMEL__)           || \
    defined(__avr32__)           || \
    defined(__hppa__)            || \
    defined(__ia64__)            || \
    defined(__mips__)            || \
    defined(__powerpc__)         || \
    defined(__ppc__)             || \
    defined(__ppc64__)           || \
    defined(_POWER)              || \
    defined(_ARCH_PPC)           || \
    defined(_ARCH_PPC64)         || \
    defined(__sparc__)           || \
    defined(__sparc)             || \
    defined(__s390__)            || \
    defined(__SH4__)             || \
    defined(__alpha__)           || \
    defined(_MIPS_ARCH_MIPS32R2) || \
    defined(__AARCH64EL__)       || \
    defined(__aarch64__)         || \
    defined(__riscv)
#define RADIX_CONV_CORRECT_FLOAT_OPERATIONS 1
#elif defined(_M_IX86) || defined(__i386__) || defined(__i386)
#ifdef _WIN32
// Windows uses a 64bit wide floating point stack.
#define RADIX_CONV_CORRECT_FLOAT_OPERATIONS 1
#else
#define RADIX_CONV_CORRECT_FLOAT_OPERATIONS 0
#endif
#else
#define RADIX_CONV_CORRECT_FLOAT_OPERATIONS 0
#endif
#endif
