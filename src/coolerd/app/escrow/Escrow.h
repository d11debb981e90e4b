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

#ifndef COOLER_APP_ESCROW_ESCROW_H_INCLUDED
#define COOLER_APP_ESCROW_ESCROW_H_INCLUDED

#include <coolerd/app/escrow/NotificationSink.h>

#include <cooler/basics/Expected.h>
#include <cooler/basics/Journal.h>
#include <cooler/basics/chrono.h>
#include <cooler/ledger/AssetLedger.h>
#include <cooler/protocol/AccountID.h>
#include <cooler/protocol/Amount.h>
#include <cooler/protocol/TER.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace cooler {

/** A borrower's offer to take a loan on fixed terms.

    Not yet a liability. The collateral it needs is held by the escrow from
    the moment the request is made until it is rescinded or cleared.
*/
struct Request
{
    // Debt the borrower asks for.
    Amount amount;
    // Annualized rate, `scale` is 100%.
    Amount interest;
    // Units of debt per unit of collateral, at `scale`.
    Amount loanToCollateral;
    NetClock::duration duration{0};
    // Cleared once, by rescind or clear.
    bool active = true;
};

/** An activated request: the lender is owed `amount` by `expiry`. */
struct Loan
{
    // The terms as they were when the request was cleared.
    Request request;
    // Outstanding debt, principal plus interest.
    Amount amount;
    Amount collateral;
    NetClock::time_point expiry;
    bool rollable = true;
    AccountID lender;
};

/** Holds one borrower's collateral and tracks their loans for a single
    (collateral asset, debt asset) pair.

    Requests and loans are append only and addressed by their index. A loan
    that closes, by full repayment or by default, leaves an empty slot so
    that ids are never reused.

    Each operation validates its inputs and computes every amount before
    touching state, then updates the ledgers, then moves assets. If the asset
    ledger refuses a transfer the ledgers are put back the way they were and
    the ledger's result is returned.

    One operation runs at a time. A call made while another is in progress,
    from an asset ledger or a notification subscriber, fails with
    tefREENTRANT and changes nothing.
*/
class Escrow
{
private:
    AccountID const account_;
    AccountID const owner_;
    AssetLedger& collateral_;
    AssetLedger& debt_;
    NotificationSink* sink_;
    Journal j_;

    std::vector<Request> requests_;
    std::vector<std::optional<Loan>> loans_;
    // Collateral repaid loans freed but the asset ledger would not deliver.
    Amount unreleased_;
    bool busy_ = false;

public:
    Escrow(
        AccountID const& account,
        AccountID const& owner,
        AssetLedger& collateral,
        AssetLedger& debt,
        NotificationSink* sink,
        Journal journal);

    Escrow(Escrow const&) = delete;
    Escrow&
    operator=(Escrow const&) = delete;

    /** Offer to borrow `amount` on the given terms.

        Pulls the collateral the terms require from `account`, which must
        have approved the escrow for it.

        @return The id of the new request.
    */
    Expected<std::uint32_t, TER>
    request(
        AccountID const& account,
        Amount const& amount,
        Amount const& interest,
        Amount const& loanToCollateral,
        NetClock::duration duration);

    /** Withdraw an active request and return its collateral to the owner. */
    TER
    rescind(AccountID const& account, std::uint32_t id);

    /** Lend against an active request.

        `account` becomes the lender. It pays out the requested amount to the
        owner, and is owed that amount plus interest by `now + duration`.
        Bounds on the terms are the lender's business; use a RiskGateway to
        enforce them.

        @return The id of the new loan.
    */
    Expected<std::uint32_t, TER>
    clear(
        AccountID const& account,
        std::uint32_t id,
        NetClock::time_point now);

    /** Pay down a loan and release collateral in proportion.

        Once the payment has reached the lender the repayment stands. If the
        asset ledger then refuses to release the collateral, it stays in the
        escrow as unreleased and the owner may reclaim it later.
    */
    TER
    repay(
        AccountID const& account,
        std::uint32_t loanId,
        Amount const& repaid,
        NetClock::time_point now);

    /** Extend a loan for another term at its original rate and ratio.

        Interest for the new term is added to the debt, and `account` tops
        up collateral so the ratio holds against the grown debt.
    */
    TER
    roll(
        AccountID const& account,
        std::uint32_t loanId,
        NetClock::time_point now);

    /** Lender only. Flip whether the loan may be rolled.

        @return The new value.
    */
    Expected<bool, TER>
    toggleRoll(AccountID const& account, std::uint32_t loanId);

    /** Seize the collateral of an expired loan for its lender.

        Anyone may call this; the collateral always goes to the lender.

        @return The collateral seized.
    */
    Expected<Amount, TER>
    defaulted(
        AccountID const& account,
        std::uint32_t loanId,
        NetClock::time_point now);

    /** Owner only. Deliver collateral held back by an earlier repayment. */
    TER
    reclaim(AccountID const& account);

    AccountID const&
    account() const
    {
        return account_;
    }

    AccountID const&
    owner() const
    {
        return owner_;
    }

    AssetID
    collateralAsset() const
    {
        return collateral_.asset();
    }

    AssetID
    debtAsset() const
    {
        return debt_.asset();
    }

    std::optional<Request>
    request(std::uint32_t id) const;

    /** @return The loan, or nothing if it never existed or has closed. */
    std::optional<Loan>
    loan(std::uint32_t loanId) const;

    Amount const&
    unreleased() const
    {
        return unreleased_;
    }

    std::uint32_t
    requestCount() const
    {
        return static_cast<std::uint32_t>(requests_.size());
    }

    std::uint32_t
    loanCount() const
    {
        return static_cast<std::uint32_t>(loans_.size());
    }

private:
    std::optional<Loan>*
    findLoan(std::uint32_t loanId);

    void
    notify(std::uint32_t id, EscrowEvent event);
};

}  // namespace cooler

#endif
