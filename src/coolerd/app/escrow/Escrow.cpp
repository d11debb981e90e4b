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
#include <coolerd/app/misc/LendingHelpers.h>

#include <limits>
#include <stdexcept>

namespace cooler {

namespace {

// The network clock is 32 bits wide. An expiry that would wrap is refused
// rather than silently landing in the past.
std::optional<NetClock::time_point>
addDuration(NetClock::time_point tp, NetClock::duration d)
{
    auto const headroom = std::numeric_limits<NetClock::rep>::max() -
        tp.time_since_epoch().count();
    if (d.count() > headroom)
        return std::nullopt;
    return tp + d;
}

// Marks an escrow busy for the length of one operation.
class ScopedOperation
{
private:
    bool& busy_;
    bool const first_;

public:
    explicit ScopedOperation(bool& busy) : busy_(busy), first_(!busy)
    {
        busy_ = true;
    }

    ~ScopedOperation()
    {
        if (first_)
            busy_ = false;
    }

    ScopedOperation(ScopedOperation const&) = delete;
    ScopedOperation&
    operator=(ScopedOperation const&) = delete;

    // False when another operation already holds the escrow.
    explicit
    operator bool() const
    {
        return first_;
    }
};

}  // namespace

Escrow::Escrow(
    AccountID const& account,
    AccountID const& owner,
    AssetLedger& collateral,
    AssetLedger& debt,
    NotificationSink* sink,
    Journal journal)
    : account_(account)
    , owner_(owner)
    , collateral_(collateral)
    , debt_(debt)
    , sink_(sink)
    , j_(journal)
{
}

Expected<std::uint32_t, TER>
Escrow::request(
    AccountID const& account,
    Amount const& amount,
    Amount const& interest,
    Amount const& loanToCollateral,
    NetClock::duration duration)
{
    ScopedOperation const op(busy_);
    if (!op)
    {
        JLOG(j_.warn()) << "Escrow is busy, request refused.";
        return Unexpected(tefREENTRANT);
    }

    if (amount == 0)
    {
        JLOG(j_.warn()) << "Request amount is zero.";
        return Unexpected(temBAD_AMOUNT);
    }

    if (loanToCollateral == 0)
    {
        JLOG(j_.warn()) << "Request loan-to-collateral ratio is zero.";
        return Unexpected(temBAD_RATIO);
    }

    Amount collateral;
    try
    {
        collateral = collateralFor(amount, loanToCollateral);
    }
    catch (std::overflow_error const& e)
    {
        JLOG(j_.warn()) << "Request collateral overflows: " << e.what();
        return Unexpected(tecOVERFLOW);
    }

    if (requests_.size() >= std::numeric_limits<std::uint32_t>::max())
    {
        JLOG(j_.warn()) << "Escrow has no request ids left.";
        return Unexpected(tecOVERFLOW);
    }

    auto const id = static_cast<std::uint32_t>(requests_.size());
    requests_.push_back(Request{
        .amount = amount,
        .interest = interest,
        .loanToCollateral = loanToCollateral,
        .duration = duration,
        .active = true});

    if (auto const ter =
            collateral_.transferFrom(account_, account, account_, collateral))
    {
        requests_.pop_back();
        JLOG(j_.warn()) << "Request collateral transfer from "
                        << to_string(account) << " failed: " << transToken(ter);
        return Unexpected(ter);
    }

    JLOG(j_.debug()) << "Request " << id << " for " << to_string(amount)
                     << " locked " << to_string(collateral) << " collateral.";
    notify(id, EscrowEvent::requested);
    return id;
}

TER
Escrow::rescind(AccountID const& account, std::uint32_t id)
{
    ScopedOperation const op(busy_);
    if (!op)
    {
        JLOG(j_.warn()) << "Escrow is busy, rescind refused.";
        return tefREENTRANT;
    }

    if (account != owner_)
    {
        JLOG(j_.warn()) << "Only the owner may rescind a request.";
        return tecNO_PERMISSION;
    }

    if (id >= requests_.size())
    {
        JLOG(j_.warn()) << "Request does not exist.";
        return tecNO_ENTRY;
    }

    auto& req = requests_[id];
    if (!req.active)
    {
        JLOG(j_.warn()) << "Request " << id << " is not active.";
        return tecREQUEST_INACTIVE;
    }

    // The same terms produced this amount when the request was made.
    auto const collateral = collateralFor(req.amount, req.loanToCollateral);

    req.active = false;

    if (auto const ter = collateral_.transfer(account_, owner_, collateral))
    {
        requests_[id].active = true;
        JLOG(j_.warn()) << "Rescind collateral refund failed: "
                        << transToken(ter);
        return ter;
    }

    JLOG(j_.debug()) << "Request " << id << " rescinded.";
    notify(id, EscrowEvent::rescinded);
    return tesSUCCESS;
}

Expected<std::uint32_t, TER>
Escrow::clear(
    AccountID const& account,
    std::uint32_t id,
    NetClock::time_point now)
{
    ScopedOperation const op(busy_);
    if (!op)
    {
        JLOG(j_.warn()) << "Escrow is busy, clear refused.";
        return Unexpected(tefREENTRANT);
    }

    if (id >= requests_.size())
    {
        JLOG(j_.warn()) << "Request does not exist.";
        return Unexpected(tecNO_ENTRY);
    }

    auto& req = requests_[id];
    if (!req.active)
    {
        JLOG(j_.warn()) << "Request " << id << " is not active.";
        return Unexpected(tecREQUEST_INACTIVE);
    }

    Amount owed;
    Amount collateral;
    try
    {
        owed = req.amount + interestFor(req.amount, req.interest, req.duration);
        collateral = collateralFor(req.amount, req.loanToCollateral);
    }
    catch (std::overflow_error const& e)
    {
        JLOG(j_.warn()) << "Loan terms overflow: " << e.what();
        return Unexpected(tecOVERFLOW);
    }

    auto const expiry = addDuration(now, req.duration);
    if (!expiry)
    {
        JLOG(j_.warn()) << "Loan expiry is past the end of the network clock.";
        return Unexpected(tecOVERFLOW);
    }

    if (loans_.size() >= std::numeric_limits<std::uint32_t>::max())
    {
        JLOG(j_.warn()) << "Escrow has no loan ids left.";
        return Unexpected(tecOVERFLOW);
    }

    auto const principal = req.amount;
    req.active = false;

    auto const loanId = static_cast<std::uint32_t>(loans_.size());
    loans_.emplace_back(Loan{
        .request = req,
        .amount = owed,
        .collateral = collateral,
        .expiry = *expiry,
        .rollable = true,
        .lender = account});

    if (auto const ter =
            debt_.transferFrom(account_, account, owner_, principal))
    {
        loans_.pop_back();
        requests_[id].active = true;
        JLOG(j_.warn()) << "Clear debt transfer from " << to_string(account)
                        << " failed: " << transToken(ter);
        return Unexpected(ter);
    }

    JLOG(j_.debug()) << "Request " << id << " cleared as loan " << loanId
                     << " owing " << to_string(owed) << " by "
                     << to_string(*expiry) << ".";
    notify(id, EscrowEvent::cleared);
    return loanId;
}

TER
Escrow::repay(
    AccountID const& account,
    std::uint32_t loanId,
    Amount const& repaid,
    NetClock::time_point now)
{
    ScopedOperation const op(busy_);
    if (!op)
    {
        JLOG(j_.warn()) << "Escrow is busy, repayment refused.";
        return tefREENTRANT;
    }

    auto* const slot = findLoan(loanId);
    if (!slot)
    {
        JLOG(j_.warn()) << "Loan does not exist.";
        return tecNO_ENTRY;
    }

    auto& loan = **slot;

    if (repaid == 0)
    {
        JLOG(j_.warn()) << "Repayment is zero.";
        return temBAD_AMOUNT;
    }

    if (now > loan.expiry)
    {
        JLOG(j_.warn()) << "Loan " << loanId << " is in default.";
        return tecEXPIRED;
    }

    if (repaid > loan.amount)
    {
        JLOG(j_.warn()) << "Repayment exceeds the outstanding debt.";
        return tecOVERPAYMENT;
    }

    Amount decollateralized;
    Amount held;
    try
    {
        decollateralized = loan.collateral * repaid / loan.amount;
        held = unreleased_ + decollateralized;
    }
    catch (std::overflow_error const& e)
    {
        JLOG(j_.warn()) << "Released collateral overflows: " << e.what();
        return tecOVERFLOW;
    }

    // Anything already held back is still in the escrow's balance.
    if (collateral_.balanceOf(account_) < held)
    {
        JLOG(j_.error()) << "Escrow " << to_string(account_)
                         << " holds less collateral than loan " << loanId
                         << " pledges.";
        return tefBAD_LEDGER;
    }

    auto const before = *slot;
    auto const lender = loan.lender;

    if (repaid == loan.amount)
    {
        slot->reset();
    }
    else
    {
        loan.amount -= repaid;
        loan.collateral -= decollateralized;
    }

    if (auto const ter = debt_.transferFrom(account_, account, lender, repaid))
    {
        loans_[loanId] = before;
        JLOG(j_.warn()) << "Repayment transfer from " << to_string(account)
                        << " failed: " << transToken(ter);
        return ter;
    }

    // The lender has been paid, so the repayment stands from here on.
    if (auto const ter =
            collateral_.transfer(account_, owner_, decollateralized))
    {
        unreleased_ = held;
        JLOG(j_.error()) << "Collateral release for loan " << loanId
                         << " failed: " << transToken(ter) << ". "
                         << to_string(decollateralized)
                         << " held for the owner to reclaim.";
        return tesSUCCESS;
    }

    JLOG(j_.debug()) << "Loan " << loanId << " repaid " << to_string(repaid)
                     << ", released " << to_string(decollateralized) << ".";
    return tesSUCCESS;
}

TER
Escrow::reclaim(AccountID const& account)
{
    ScopedOperation const op(busy_);
    if (!op)
    {
        JLOG(j_.warn()) << "Escrow is busy, reclaim refused.";
        return tefREENTRANT;
    }

    if (account != owner_)
    {
        JLOG(j_.warn()) << "Only the owner may reclaim collateral.";
        return tecNO_PERMISSION;
    }

    if (unreleased_ == 0)
    {
        JLOG(j_.warn()) << "No collateral is waiting to be reclaimed.";
        return tecNO_ENTRY;
    }

    auto const held = unreleased_;
    unreleased_ = 0;

    if (auto const ter = collateral_.transfer(account_, owner_, held))
    {
        unreleased_ = held;
        JLOG(j_.warn()) << "Reclaim of " << to_string(held)
                        << " failed: " << transToken(ter);
        return ter;
    }

    JLOG(j_.debug()) << "Owner reclaimed " << to_string(held) << ".";
    return tesSUCCESS;
}

TER
Escrow::roll(
    AccountID const& account,
    std::uint32_t loanId,
    NetClock::time_point now)
{
    ScopedOperation const op(busy_);
    if (!op)
    {
        JLOG(j_.warn()) << "Escrow is busy, roll refused.";
        return tefREENTRANT;
    }

    auto* const slot = findLoan(loanId);
    if (!slot)
    {
        JLOG(j_.warn()) << "Loan does not exist.";
        return tecNO_ENTRY;
    }

    auto& loan = **slot;

    if (now > loan.expiry)
    {
        JLOG(j_.warn()) << "Loan " << loanId << " is in default.";
        return tecEXPIRED;
    }

    if (!loan.rollable)
    {
        JLOG(j_.warn()) << "Loan " << loanId << " is not rollable.";
        return tecNOT_ROLLABLE;
    }

    // Always the terms frozen into the loan, never the request ledger.
    auto const& terms = loan.request;

    Amount newCollateral;
    Amount amount;
    Amount collateral;
    try
    {
        auto const needed = collateralFor(loan.amount, terms.loanToCollateral);
        // Truncation can leave the escrow already holding enough.
        newCollateral =
            needed > loan.collateral ? needed - loan.collateral : Amount(0);
        amount = loan.amount +
            interestFor(loan.amount, terms.interest, terms.duration);
        collateral = loan.collateral + newCollateral;
    }
    catch (std::overflow_error const& e)
    {
        JLOG(j_.warn()) << "Rolled loan overflows: " << e.what();
        return tecOVERFLOW;
    }

    auto const expiry = addDuration(loan.expiry, terms.duration);
    if (!expiry)
    {
        JLOG(j_.warn()) << "Loan expiry is past the end of the network clock.";
        return tecOVERFLOW;
    }

    auto const before = *slot;

    loan.amount = amount;
    loan.collateral = collateral;
    loan.expiry = *expiry;

    if (auto const ter = collateral_.transferFrom(
            account_, account, account_, newCollateral))
    {
        loans_[loanId] = before;
        JLOG(j_.warn()) << "Roll collateral transfer from "
                        << to_string(account) << " failed: " << transToken(ter);
        return ter;
    }

    JLOG(j_.debug()) << "Loan " << loanId << " rolled to "
                     << to_string(*expiry) << ", owing " << to_string(amount)
                     << ".";
    return tesSUCCESS;
}

Expected<bool, TER>
Escrow::toggleRoll(AccountID const& account, std::uint32_t loanId)
{
    ScopedOperation const op(busy_);
    if (!op)
    {
        JLOG(j_.warn()) << "Escrow is busy, rollover toggle refused.";
        return Unexpected(tefREENTRANT);
    }

    auto* const slot = findLoan(loanId);
    if (!slot)
    {
        JLOG(j_.warn()) << "Loan does not exist.";
        return Unexpected(tecNO_ENTRY);
    }

    auto& loan = **slot;

    if (account != loan.lender)
    {
        JLOG(j_.warn()) << "Only the lender may toggle rollover.";
        return Unexpected(tecNO_PERMISSION);
    }

    loan.rollable = !loan.rollable;
    return loan.rollable;
}

Expected<Amount, TER>
Escrow::defaulted(
    AccountID const& account,
    std::uint32_t loanId,
    NetClock::time_point now)
{
    ScopedOperation const op(busy_);
    if (!op)
    {
        JLOG(j_.warn()) << "Escrow is busy, default refused.";
        return Unexpected(tefREENTRANT);
    }

    auto* const slot = findLoan(loanId);
    if (!slot)
    {
        JLOG(j_.warn()) << "Loan does not exist.";
        return Unexpected(tecNO_ENTRY);
    }

    auto const& loan = **slot;

    if (now <= loan.expiry)
    {
        JLOG(j_.warn()) << "Loan " << loanId << " has not expired yet.";
        return Unexpected(tecTOO_SOON);
    }

    auto const before = *slot;
    auto const seized = loan.collateral;
    auto const lender = loan.lender;

    slot->reset();

    if (auto const ter = collateral_.transfer(account_, lender, seized))
    {
        loans_[loanId] = before;
        JLOG(j_.warn()) << "Collateral seizure for loan " << loanId
                        << " failed: " << transToken(ter);
        return Unexpected(ter);
    }

    JLOG(j_.info()) << "Loan " << loanId << " defaulted by "
                    << to_string(account) << ", " << to_string(seized)
                    << " collateral seized for " << to_string(lender) << ".";
    return seized;
}

std::optional<Request>
Escrow::request(std::uint32_t id) const
{
    if (id >= requests_.size())
        return std::nullopt;
    return requests_[id];
}

std::optional<Loan>
Escrow::loan(std::uint32_t loanId) const
{
    if (loanId >= loans_.size())
        return std::nullopt;
    return loans_[loanId];
}

std::optional<Loan>*
Escrow::findLoan(std::uint32_t loanId)
{
    if (loanId >= loans_.size() || !loans_[loanId])
        return nullptr;
    return &loans_[loanId];
}

void
Escrow::notify(std::uint32_t id, EscrowEvent event)
{
    if (sink_)
        sink_->notify(account_, id, event);
}

}  // namespace cooler
