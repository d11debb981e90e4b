//------------------------------------------------------------------------------
/*
    This file is part of cooler.
    Copyright (c) 2026 The cooler developers.

    Permission to use, copy, modify, and/or distribute this software for any
    purpose  with  or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL ,  DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#ifndef COOLER_PROTOCOL_AMOUNT_H_INCLUDED
#define COOLER_PROTOCOL_AMOUNT_H_INCLUDED

#include <boost/multiprecision/cpp_int.hpp>

#include <optional>
#include <string>

namespace cooler {

/** A quantity of some asset, or a fixed-point rate or ratio.

    Unsigned and 256 bits wide. Arithmetic is checked: any operation that
    would overflow, underflow below zero or divide by zero throws instead of
    wrapping.
*/
using Amount = boost::multiprecision::checked_uint256_t;

/** The fixed-point unit: 18 decimal places.

    An interest rate of `scale` is 100% per year, and a loan-to-collateral
    ratio of `scale` lends one unit of debt per unit of collateral.
*/
inline Amount const scale{1'000'000'000'000'000'000ull};

/** Parse an amount written as a decimal integer.

    A trailing exponent is accepted, so "2500e18" and "0.02e18" both parse.
    The result must be a whole number of base units.

    @return The amount, or std::nullopt if the text is malformed, has a
            fractional remainder, or does not fit in 256 bits.
*/
std::optional<Amount>
parseAmount(std::string const& text);

std::string
to_string(Amount const& amount);

}  // namespace cooler

#endif
