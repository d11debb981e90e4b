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

#include <coolerd/app/escrow/EscrowFactory.h>

#include <boost/container_hash/hash.hpp>

namespace cooler {

namespace {

// Escrow accounts have the high bit set, which keeps them apart from the
// small ids participants are usually given.
std::uint64_t constexpr escrowAccountBit = std::uint64_t(1) << 63;

}  // namespace

EscrowFactory::EscrowFactory(Journal journal) : j_(journal)
{
}

void
EscrowFactory::addLedger(AssetLedger& ledger)
{
    ledgers_.insert_or_assign(ledger.asset(), std::ref(ledger));
}

void
EscrowFactory::subscribe(Subscriber subscriber)
{
    subscriber_ = std::move(subscriber);
}

Expected<AccountID, TER>
EscrowFactory::generate(
    AccountID const& owner,
    AssetID const& collateral,
    AssetID const& debt)
{
    Triple const triple{owner, collateral, debt};

    if (auto const it = byTriple_.find(triple); it != byTriple_.end())
        return it->second;

    auto const collateralLedger = ledgers_.find(collateral);
    auto const debtLedger = ledgers_.find(debt);
    if (collateralLedger == ledgers_.end() || debtLedger == ledgers_.end())
    {
        JLOG(j_.warn()) << "No ledger for asset pair " << collateral << "/"
                        << debt << ".";
        return Unexpected(tecWRONG_ASSET);
    }

    auto const account = deriveAccount(triple);
    escrows_.emplace(
        account,
        std::make_unique<Escrow>(
            account,
            owner,
            collateralLedger->second.get(),
            debtLedger->second.get(),
            this,
            j_));
    byTriple_.emplace(triple, account);

    JLOG(j_.info()) << "Escrow " << to_string(account) << " created for "
                    << to_string(owner) << " on " << collateral << "/" << debt
                    << ".";
    return account;
}

bool
EscrowFactory::isGenuine(AccountID const& escrow) const
{
    return escrows_.find(escrow) != escrows_.end();
}

Escrow*
EscrowFactory::escrow(AccountID const& escrow) const
{
    auto const it = escrows_.find(escrow);
    if (it == escrows_.end())
        return nullptr;
    return it->second.get();
}

void
EscrowFactory::notify(
    AccountID const& escrow,
    std::uint32_t id,
    EscrowEvent event)
{
    JLOG(j_.info()) << "Escrow " << to_string(escrow) << " request " << id
                    << " " << to_string(event) << ".";

    if (subscriber_)
        subscriber_(escrow, id, event);
}

AccountID
EscrowFactory::deriveAccount(Triple const& triple) const
{
    std::size_t seed = 0;
    boost::hash_combine(seed, std::get<0>(triple).value());
    boost::hash_combine(seed, std::get<1>(triple).value());
    boost::hash_combine(seed, std::get<2>(triple).value());

    AccountID account(static_cast<std::uint64_t>(seed) | escrowAccountBit);

    // Another triple already hashed here. Keep hashing until the account is
    // free; the outcome depends only on the triples generated before.
    while (escrows_.find(account) != escrows_.end())
    {
        boost::hash_combine(seed, account.value());
        account = AccountID(static_cast<std::uint64_t>(seed) | escrowAccountBit);
    }

    return account;
}

}  // namespace cooler
