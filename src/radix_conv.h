// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

namespace radix_conv {

//==================================================================================================
// Strtod
//
// Converts the numeral at the start of [next, last) into the nearest double- or single-precision
// number (round to nearest, ties to even).
//
// Grammar (case-insensitive):
//
//      [+-] ( digits [ "." digits ] [ exponent ]
//           | "." digits [ exponent ]
//           | "inf" | "infinity"
//           | "nan" [ "(" [_0-9a-zA-Z]* ")" ] )
//
//      exponent = marker [+-] digits
//
// Digits are '0'...'9', 'a'...'z' (or 'A'...'Z') for the values 0...35, restricted to the radix.
// The exponent marker is 'e' (or 'E') for radix <= 14 and '^' for radix >= 15. The exponent
// digits use the same radix, e.g. "1^10" = 16^16 in radix 16.
//
// "inf" and "nan" are only recognized if their first letter is not a digit in the given radix.
//==================================================================================================

enum class StrtodStatus {
    invalid,
    number,
    inf,
    nan,
};

struct StrtodResult {
    char const* next;
    StrtodStatus status;

    explicit operator bool() const { return status != StrtodStatus::invalid; }
};

// On success, stores the (possibly negative) result in value and returns the end of the numeral.
// Otherwise returns {next, StrtodStatus::invalid} and leaves value unchanged.
StrtodResult Strtod(int radix, char const* next, char const* last, double& value);

StrtodResult Strtof(int radix, char const* next, char const* last, float& value);

// Converts [first, last) into a double-precision number.
// Returns NaN if [first, last) does not start with a valid numeral.
double DigitsToDouble(int radix, char const* first, char const* last);

// Converts [first, last) into a single-precision number.
// Returns NaN if [first, last) does not start with a valid numeral.
float DigitsToFloat(int radix, char const* first, char const* last);

} // namespace radix_conv
