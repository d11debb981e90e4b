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

#include <coolerd/app/escrow/Escrow.h>
#include <coolerd/app/gateway/RiskGateway.h>

namespace cooler {

RiskGateway::RiskGateway(
    AccountID const& account,
    AccountID const& operatorAccount,
    AccountID const& overseerAccount,
    AssetLedger& collateral,
    AssetLedger& debt,
    EscrowRegistry& registry,
    Treasury& treasury,
    RiskGatewaySetup const& setup,
    Journal journal)
    : account_(account)
    , operator_(operatorAccount)
    , overseer_(overseerAccount)
    , collateral_(collateral)
    , debt_(debt)
    , registry_(registry)
    , treasury_(treasury)
    , setup_(setup)
    , j_(journal)
{
}

Expected<std::uint32_t, TER>
RiskGateway::clear(
    AccountID const& account,
    AccountID const& escrow,
    std::uint32_t requestId,
    NetClock::time_point now)
{
    if (account != operator_)
    {
        JLOG(j_.warn()) << "Only the operator may clear through the gateway.";
        return Unexpected(tecNO_PERMISSION);
    }

    auto* const target =
        registry_.isGenuine(escrow) ? registry_.escrow(escrow) : nullptr;
    if (!target)
    {
        JLOG(j_.warn()) << "Escrow " << to_string(escrow)
                        << " is not known to the registry.";
        return Unexpected(tecUNKNOWN_ESCROW);
    }

    if (target->collateralAsset() != collateral_.asset() ||
        target->debtAsset() != debt_.asset())
    {
        JLOG(j_.warn()) << "Escrow " << to_string(escrow)
                        << " trades a different asset pair.";
        return Unexpected(tecWRONG_ASSET);
    }

    auto const request = target->request(requestId);
    if (!request)
    {
        JLOG(j_.warn()) << "Request does not exist.";
        return Unexpected(tecNO_ENTRY);
    }

    if (!request->active)
    {
        JLOG(j_.warn()) << "Request " << requestId << " is not active.";
        return Unexpected(tecREQUEST_INACTIVE);
    }

    if (request->interest < setup_.minimumInterest)
    {
        JLOG(j_.warn()) << "Interest " << to_string(request->interest)
                        << " is below the minimum.";
        return Unexpected(tecINTEREST_MINIMUM);
    }

    if (request->loanToCollateral > setup_.maxLoanToCollateral)
    {
        JLOG(j_.warn()) << "Loan-to-collateral "
                        << to_string(request->loanToCollateral)
                        << " is above the maximum.";
        return Unexpected(tecLTC_MAXIMUM);
    }

    if (request->duration > setup_.maxDuration)
    {
        JLOG(j_.warn()) << "Duration " << request->duration.count()
                        << "s is above the maximum.";
        return Unexpected(tecDURATION_MAXIMUM);
    }

    if (auto const ter = debt_.approve(account_, escrow, request->amount))
    {
        JLOG(j_.warn()) << "Allowance for escrow " << to_string(escrow)
                        << " failed: " << transToken(ter);
        return Unexpected(ter);
    }

    auto const loanId = target->clear(account_, requestId, now);
    if (!loanId)
    {
        // The escrow pulled nothing; withdraw what it was allowed to pull.
        if (auto const ter = debt_.approve(account_, escrow, Amount(0)))
        {
            JLOG(j_.error()) << "Allowance reset for escrow "
                             << to_string(escrow)
                             << " failed: " << transToken(ter);
        }
        return Unexpected(loanId.error());
    }

    JLOG(j_.info()) << "Gateway cleared request " << requestId << " of escrow "
                    << to_string(escrow) << " as loan " << *loanId << ".";
    return *loanId;
}

Expected<bool, TER>
RiskGateway::toggleRoll(
    AccountID const& account,
    AccountID const& escrow,
    std::uint32_t loanId)
{
    if (account != operator_)
    {
        JLOG(j_.warn()) << "Only the operator may toggle rollover.";
        return Unexpected(tecNO_PERMISSION);
    }

    auto* const target =
        registry_.isGenuine(escrow) ? registry_.escrow(escrow) : nullptr;
    if (!target)
    {
        JLOG(j_.warn()) << "Escrow " << to_string(escrow)
                        << " is not known to the registry.";
        return Unexpected(tecUNKNOWN_ESCROW);
    }

    return target->toggleRoll(account_, loanId);
}

TER
RiskGateway::fund(AccountID const& account, Amount const& amount)
{
    if (account != overseer_)
    {
        JLOG(j_.warn()) << "Only the overseer may fund the gateway.";
        return tecNO_PERMISSION;
    }

    if (amount == 0)
    {
        JLOG(j_.warn()) << "Funding amount is zero.";
        return temBAD_AMOUNT;
    }

    if (auto const ter = treasury_.manage(account_, debt_.asset(), amount))
    {
        JLOG(j_.warn()) << "Treasury refused " << to_string(amount) << ": "
                        << transToken(ter);
        return ter;
    }

    JLOG(j_.info()) << "Gateway funded with " << to_string(amount) << ".";
    return tesSUCCESS;
}

TER
RiskGateway::defund(
    AccountID const& account,
    AssetID const& asset,
    Amount const& amount)
{
    if (account != operator_ && account != overseer_)
    {
        JLOG(j_.warn()) << "Only the operator or overseer may defund.";
        return tecNO_PERMISSION;
    }

    AssetLedger* ledger = nullptr;
    if (asset == debt_.asset())
        ledger = &debt_;
    else if (asset == collateral_.asset())
        ledger = &collateral_;

    if (!ledger)
    {
        JLOG(j_.warn()) << "Asset " << asset << " is not handled here.";
        return tecWRONG_ASSET;
    }

    if (auto const ter =
            ledger->transfer(account_, treasury_.account(), amount))
    {
        JLOG(j_.warn()) << "Return to treasury failed: " << transToken(ter);
        return ter;
    }

    JLOG(j_.info()) << "Returned " << to_string(amount) << " of asset "
                    << asset << " to the treasury.";
    return tesSUCCESS;
}

TER
RiskGateway::proposeOperator(AccountID const& account, AccountID const& next)
{
    if (account != operator_)
    {
        JLOG(j_.warn()) << "Only the operator may propose a new operator.";
        return tecNO_PERMISSION;
    }

    pendingOperator_ = next;
    JLOG(j_.info()) << "Operator handoff to " << to_string(next)
                    << " proposed.";
    return tesSUCCESS;
}

TER
RiskGateway::acceptOperator(AccountID const& account)
{
    if (!pendingOperator_ || account != *pendingOperator_)
    {
        JLOG(j_.warn()) << "Only the proposed operator may accept.";
        return tecNO_PERMISSION;
    }

    operator_ = *pendingOperator_;
    pendingOperator_.reset();
    JLOG(j_.info()) << "Operator is now " << to_string(operator_) << ".";
    return tesSUCCESS;
}

TER
RiskGateway::proposeOverseer(AccountID const& account, AccountID const& next)
{
    if (account != overseer_)
    {
        JLOG(j_.warn()) << "Only the overseer may propose a new overseer.";
        return tecNO_PERMISSION;
    }

    pendingOverseer_ = next;
    JLOG(j_.info()) << "Overseer handoff to " << to_string(next)
                    << " proposed.";
    return tesSUCCESS;
}

TER
RiskGateway::acceptOverseer(AccountID const& account)
{
    if (!pendingOverseer_ || account != *pendingOverseer_)
    {
        JLOG(j_.warn()) << "Only the proposed overseer may accept.";
        return tecNO_PERMISSION;
    }

    overseer_ = *pendingOverseer_;
    pendingOverseer_.reset();
    JLOG(j_.info()) << "Overseer is now " << to_string(overseer_) << ".";
    return tesSUCCESS;
}

}  // namespace cooler
