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

#ifndef COOLER_APP_MISC_LENDINGHELPERS_H_INCLUDED
#define COOLER_APP_MISC_LENDINGHELPERS_H_INCLUDED

#include <cooler/basics/chrono.h>
#include <cooler/protocol/Amount.h>
#include <cooler/protocol/Protocol.h>

namespace cooler {

/* Computes the collateral that secures `amount` of debt at a fixed
 * loan-to-collateral ratio.
 *
 * Both values are fixed point at `scale`. The result truncates toward zero,
 * so the escrow never asks for a fraction of a base unit more than the ratio
 * demands.
 *
 * Throws std::domain_error if `loanToCollateral` is zero, and
 * std::overflow_error if `amount * scale` does not fit in an Amount.
 */
Amount
collateralFor(Amount const& amount, Amount const& loanToCollateral);

/* Computes the simple interest owed on `amount` for `duration` at the
 * annualized fixed-point `rate`.
 *
 * The order of operations is part of the protocol: the rate is prorated to
 * the duration first, then applied to the amount. Rounding the other way
 * gives different results and would make independently computed loan
 * balances disagree.
 */
Amount
interestFor(
    Amount const& amount,
    Amount const& rate,
    NetClock::duration duration);

}  // namespace cooler

#endif
