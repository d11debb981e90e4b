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

#include <test/jtx/Env.h>

#include <coolerd/app/escrow/EscrowFactory.h>

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace cooler;
using namespace cooler::test::jtx;

TEST_SUITE_BEGIN("EscrowFactory");

TEST_CASE("generate is idempotent per owner and asset pair")
{
    Env env;
    Account const alice{"alice", 1};
    Account const bob{"bob", 2};
    TestLedger other(AssetID(3));
    env.factory.addLedger(other);

    auto const collateral = env.collateral.asset();
    auto const debt = env.debt.asset();

    auto const first = env.factory.generate(alice, collateral, debt);
    REQUIRE(first);
    auto const again = env.factory.generate(alice, collateral, debt);
    REQUIRE(again);
    CHECK(*first == *again);

    auto const forBob = env.factory.generate(bob, collateral, debt);
    auto const reversed = env.factory.generate(alice, debt, collateral);
    auto const otherDebt = env.factory.generate(alice, collateral, other.asset());
    REQUIRE(forBob);
    REQUIRE(reversed);
    REQUIRE(otherDebt);

    std::vector<AccountID> const accounts{
        *first, *forBob, *reversed, *otherDebt};
    for (std::size_t i = 0; i < accounts.size(); ++i)
    {
        // Escrow accounts never collide with small participant ids.
        CHECK(accounts[i].value() >> 63 == 1);
        for (std::size_t j = i + 1; j < accounts.size(); ++j)
            CHECK(accounts[i] != accounts[j]);
    }
}

TEST_CASE("account derivation is deterministic")
{
    Env one;
    Env two;
    AccountID const owner(42);

    auto const a = one.factory.generate(
        owner, one.collateral.asset(), one.debt.asset());
    auto const b = two.factory.generate(
        owner, two.collateral.asset(), two.debt.asset());
    REQUIRE(a);
    REQUIRE(b);
    CHECK(*a == *b);
}

TEST_CASE("generated escrows")
{
    Env env;
    Account const alice{"alice", 1};

    auto const account =
        env.factory.generate(alice, env.collateral.asset(), env.debt.asset());
    REQUIRE(account);

    CHECK(env.factory.isGenuine(*account));
    auto* const escrow = env.factory.escrow(*account);
    REQUIRE(escrow);
    CHECK(escrow->account() == *account);
    CHECK(escrow->owner() == alice.id());
    CHECK(escrow->collateralAsset() == env.collateral.asset());
    CHECK(escrow->debtAsset() == env.debt.asset());
    CHECK(escrow->requestCount() == 0);
    CHECK(escrow->loanCount() == 0);
}

TEST_CASE("unknown escrows")
{
    Env env;

    CHECK_FALSE(env.factory.isGenuine(AccountID(1)));
    CHECK(env.factory.escrow(AccountID(1)) == nullptr);

    // An escrow built outside the factory is not vouched for.
    Escrow standalone(
        AccountID(77), AccountID(1), env.collateral, env.debt, nullptr,
        env.journal);
    CHECK_FALSE(env.factory.isGenuine(standalone.account()));
}

TEST_CASE("generate needs a ledger for both assets")
{
    Env env;

    auto const missing = env.factory.generate(
        AccountID(1), env.collateral.asset(), AssetID(9));
    REQUIRE_FALSE(missing);
    CHECK(missing.error() == tecWRONG_ASSET);
    CHECK(env.log.str().find("No ledger for asset pair 1/9") != std::string::npos);
}

TEST_CASE("events are logged and forwarded")
{
    Env env;
    Account const alice{"alice", 1};
    auto& escrow = env.escrow(alice);
    env.fund(alice, units(1), units(0));
    env.approve(alice, escrow.account());

    // Without a subscriber events are only logged.
    auto const first =
        escrow.request(alice, units(1), percent(5), units(1), days(1));
    REQUIRE(first);

    std::vector<EscrowEvent> events;
    env.factory.subscribe(
        [&](AccountID const&, std::uint32_t, EscrowEvent event) {
            events.push_back(event);
        });

    CHECK(escrow.rescind(alice, *first) == tesSUCCESS);
    REQUIRE(events.size() == 1);
    CHECK(events[0] == EscrowEvent::rescinded);

    auto const log = env.log.str();
    CHECK(log.find("request 0 requested.") != std::string::npos);
    CHECK(log.find("request 0 rescinded.") != std::string::npos);
}

TEST_SUITE_END();
