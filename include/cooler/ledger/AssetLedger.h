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

#ifndef COOLER_LEDGER_ASSETLEDGER_H_INCLUDED
#define COOLER_LEDGER_ASSETLEDGER_H_INCLUDED

#include <cooler/protocol/AccountID.h>
#include <cooler/protocol/Amount.h>
#include <cooler/protocol/TER.h>

namespace cooler {

/** The balances and allowances of one fungible asset.

    Escrows and gateways do not keep balances of their own. They move assets
    through this interface and treat every transfer as a call that may fail.

    Every transfer is all or nothing: on failure no balance or allowance
    changed.
*/
class AssetLedger
{
public:
    virtual ~AssetLedger() = default;

    /** The asset whose balances this ledger keeps. */
    virtual AssetID
    asset() const = 0;

    /** Move `amount` from `from` to `to`, authorized by `from` itself.

        @return tesSUCCESS, or tecUNFUNDED if `from` holds less than `amount`.
    */
    virtual TER
    transfer(
        AccountID const& from,
        AccountID const& to,
        Amount const& amount) = 0;

    /** Move `amount` from `from` to `to` on behalf of `spender`.

        Consumes `amount` of the allowance `from` granted `spender`.

        @return tesSUCCESS, tecNO_AUTH if the allowance is too small, or
                tecUNFUNDED if `from` holds less than `amount`.
    */
    virtual TER
    transferFrom(
        AccountID const& spender,
        AccountID const& from,
        AccountID const& to,
        Amount const& amount) = 0;

    /** Set the allowance `owner` grants `spender` to exactly `amount`. */
    virtual TER
    approve(
        AccountID const& owner,
        AccountID const& spender,
        Amount const& amount) = 0;

    virtual Amount
    balanceOf(AccountID const& account) const = 0;
};

}  // namespace cooler

#endif
