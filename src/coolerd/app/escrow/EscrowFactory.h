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

#ifndef COOLER_APP_ESCROW_ESCROWFACTORY_H_INCLUDED
#define COOLER_APP_ESCROW_ESCROWFACTORY_H_INCLUDED

#include <coolerd/app/escrow/Escrow.h>
#include <coolerd/app/escrow/EscrowRegistry.h>
#include <coolerd/app/escrow/NotificationSink.h>

#include <cooler/basics/Journal.h>
#include <cooler/ledger/AssetLedger.h>

#include <functional>
#include <map>
#include <memory>
#include <tuple>
#include <unordered_map>

namespace cooler {

/** The registry of escrows, and the sink for their events.

    Asset ledgers are registered up front; an escrow can only be generated
    for assets the factory has a ledger for.

    Each escrow's account is derived from its (owner, collateral, debt)
    triple, so the same triple maps to the same account across factories
    that see the same sequence of triples.
*/
class EscrowFactory : public EscrowRegistry, public NotificationSink
{
public:
    using Subscriber = std::function<
        void(AccountID const& escrow, std::uint32_t id, EscrowEvent event)>;

private:
    using Triple = std::tuple<AccountID, AssetID, AssetID>;

    Journal j_;
    std::unordered_map<AssetID, std::reference_wrapper<AssetLedger>> ledgers_;
    std::map<Triple, AccountID> byTriple_;
    std::unordered_map<AccountID, std::unique_ptr<Escrow>> escrows_;
    Subscriber subscriber_;

public:
    explicit EscrowFactory(Journal journal);

    EscrowFactory(EscrowFactory const&) = delete;
    EscrowFactory&
    operator=(EscrowFactory const&) = delete;

    /** Make `ledger` available to escrows. The ledger must outlive the
        factory. Registering a second ledger for the same asset replaces
        the first for escrows generated afterwards.
    */
    void
    addLedger(AssetLedger& ledger);

    /** Forward every event to `subscriber` after logging it. */
    void
    subscribe(Subscriber subscriber);

    Expected<AccountID, TER>
    generate(
        AccountID const& owner,
        AssetID const& collateral,
        AssetID const& debt) override;

    bool
    isGenuine(AccountID const& escrow) const override;

    Escrow*
    escrow(AccountID const& escrow) const override;

    void
    notify(AccountID const& escrow, std::uint32_t id, EscrowEvent event)
        override;

private:
    AccountID
    deriveAccount(Triple const& triple) const;
};

}  // namespace cooler

#endif
