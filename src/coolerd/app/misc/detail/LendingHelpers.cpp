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

#include <coolerd/app/misc/LendingHelpers.h>

#include <cooler/basics/contract.h>

#include <stdexcept>

namespace cooler {

Amount
collateralFor(Amount const& amount, Amount const& loanToCollateral)
{
    if (loanToCollateral == 0)
        Throw<std::domain_error>(
            "collateralFor : loan-to-collateral ratio is zero");

    return amount * scale / loanToCollateral;
}

Amount
interestFor(
    Amount const& amount,
    Amount const& rate,
    NetClock::duration duration)
{
    Amount const periodicRate = rate * duration.count() / secondsInYear;
    return amount * periodicRate / scale;
}

}  // namespace cooler
