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

#ifndef COOLER_APP_GATEWAY_RISKGATEWAY_H_INCLUDED
#define COOLER_APP_GATEWAY_RISKGATEWAY_H_INCLUDED

#include <coolerd/app/escrow/EscrowRegistry.h>
#include <coolerd/app/gateway/Treasury.h>
#include <coolerd/core/Config.h>

#include <cooler/basics/Expected.h>
#include <cooler/basics/Journal.h>
#include <cooler/basics/chrono.h>
#include <cooler/ledger/AssetLedger.h>
#include <cooler/protocol/AccountID.h>
#include <cooler/protocol/Amount.h>
#include <cooler/protocol/TER.h>

#include <cstdint>
#include <optional>

namespace cooler {

/** Lends treasury funds to escrows, but only on acceptable terms.

    The gateway is itself the lender of every loan it clears. It serves one
    (collateral, debt) asset pair and only clears requests that are within
    its bounds.

    Two roles control it:

    - The operator decides which requests to clear and whether their loans
      may be rolled.
    - The overseer draws funds from the treasury.

    Either role may return funds to the treasury. Each role is handed over
    in two steps: the current holder proposes a successor, and the successor
    accepts.
*/
class RiskGateway
{
private:
    AccountID const account_;
    AccountID operator_;
    AccountID overseer_;
    std::optional<AccountID> pendingOperator_;
    std::optional<AccountID> pendingOverseer_;

    AssetLedger& collateral_;
    AssetLedger& debt_;
    EscrowRegistry& registry_;
    Treasury& treasury_;

    RiskGatewaySetup const setup_;
    Journal j_;

public:
    RiskGateway(
        AccountID const& account,
        AccountID const& operatorAccount,
        AccountID const& overseerAccount,
        AssetLedger& collateral,
        AssetLedger& debt,
        EscrowRegistry& registry,
        Treasury& treasury,
        RiskGatewaySetup const& setup,
        Journal journal);

    RiskGateway(RiskGateway const&) = delete;
    RiskGateway&
    operator=(RiskGateway const&) = delete;

    /** Operator only. Clear request `requestId` of `escrow` with the
        gateway as lender, if its terms are within bounds.

        @return The id of the new loan in the escrow.
    */
    Expected<std::uint32_t, TER>
    clear(
        AccountID const& account,
        AccountID const& escrow,
        std::uint32_t requestId,
        NetClock::time_point now);

    /** Operator only. Toggle rollover on a loan the gateway made. */
    Expected<bool, TER>
    toggleRoll(
        AccountID const& account,
        AccountID const& escrow,
        std::uint32_t loanId);

    /** Overseer only. Draw `amount` of the debt asset from the treasury. */
    TER
    fund(AccountID const& account, Amount const& amount);

    /** Operator or overseer. Return `amount` of `asset` to the treasury. */
    TER
    defund(AccountID const& account, AssetID const& asset, Amount const& amount);

    TER
    proposeOperator(AccountID const& account, AccountID const& next);

    TER
    acceptOperator(AccountID const& account);

    TER
    proposeOverseer(AccountID const& account, AccountID const& next);

    TER
    acceptOverseer(AccountID const& account);

    AccountID const&
    account() const
    {
        return account_;
    }

    AccountID const&
    operatorAccount() const
    {
        return operator_;
    }

    AccountID const&
    overseer() const
    {
        return overseer_;
    }

    std::optional<AccountID> const&
    pendingOperator() const
    {
        return pendingOperator_;
    }

    std::optional<AccountID> const&
    pendingOverseer() const
    {
        return pendingOverseer_;
    }

    RiskGatewaySetup const&
    setup() const
    {
        return setup_;
    }
};

}  // namespace cooler

#endif
