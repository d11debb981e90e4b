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

#ifndef COOLER_PROTOCOL_PROTOCOL_H_INCLUDED
#define COOLER_PROTOCOL_PROTOCOL_H_INCLUDED

#include <cooler/basics/chrono.h>
#include <cooler/protocol/Amount.h>

#include <chrono>
#include <cstdint>

namespace cooler {

/** Protocol specific constants.

    These are the rules every escrow and gateway agrees on.
*/
/** @{ */

/** The length of a year for interest purposes: 365 days, no leap days. */
std::uint32_t constexpr secondsInYear = 365 * 24 * 60 * 60;

/** The smallest interest rate a gateway accepts unless configured: 2%. */
inline Amount const defaultMinimumInterest{20'000'000'000'000'000ull};

/** The largest loan-to-collateral ratio a gateway accepts unless
    configured: 2500 units of debt per unit of collateral. */
inline Amount const defaultMaxLoanToCollateral = scale * 2500;

/** The longest tenor a gateway accepts unless configured. */
NetClock::duration constexpr defaultMaxDuration{secondsInYear};

/** @} */

}  // namespace cooler

#endif
