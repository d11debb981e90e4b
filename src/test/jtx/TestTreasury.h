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

#ifndef COOLER_TEST_JTX_TESTTREASURY_H_INCLUDED
#define COOLER_TEST_JTX_TESTTREASURY_H_INCLUDED

#include <test/jtx/TestLedger.h>

#include <coolerd/app/gateway/Treasury.h>

#include <functional>
#include <set>
#include <unordered_map>

namespace cooler {
namespace test {
namespace jtx {

/** A Treasury that pays authorized recipients out of its own balance. */
class TestTreasury : public Treasury
{
private:
    AccountID const account_;
    std::unordered_map<AssetID, std::reference_wrapper<TestLedger>> ledgers_;
    std::set<AccountID> authorized_;

public:
    explicit TestTreasury(AccountID const& account) : account_(account)
    {
    }

    void
    addLedger(TestLedger& ledger)
    {
        ledgers_.insert_or_assign(ledger.asset(), std::ref(ledger));
    }

    void
    authorize(AccountID const& recipient)
    {
        authorized_.insert(recipient);
    }

    void
    revoke(AccountID const& recipient)
    {
        authorized_.erase(recipient);
    }

    AccountID
    account() const override
    {
        return account_;
    }

    TER
    manage(
        AccountID const& recipient,
        AssetID const& asset,
        Amount const& amount) override
    {
        if (authorized_.count(recipient) == 0)
            return tecNO_PERMISSION;

        auto const it = ledgers_.find(asset);
        if (it == ledgers_.end())
            return tecWRONG_ASSET;

        return it->second.get().transfer(account_, recipient, amount);
    }
};

}  // namespace jtx
}  // namespace test
}  // namespace cooler

#endif
