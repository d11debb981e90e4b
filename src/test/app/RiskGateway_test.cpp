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

#include <coolerd/app/gateway/RiskGateway.h>

#include <doctest/doctest.h>

using namespace cooler;
using namespace cooler::test::jtx;

TEST_SUITE_BEGIN("RiskGateway");

namespace {

struct GatewayFixture
{
    Env env;
    Account const alice{"alice", 1};
    Account const bob{"bob", 2};
    Account const op{"operator", 10};
    Account const overseer{"overseer", 11};
    Account const stranger{"stranger", 12};
    Account const gatewayAccount{"gateway", 100};
    TestLedger other{AssetID(3)};
    RiskGateway gateway;
    Escrow& escrow;

    explicit GatewayFixture(RiskGatewaySetup const& setup = {})
        : gateway(
              gatewayAccount,
              op,
              overseer,
              env.collateral,
              env.debt,
              env.factory,
              env.treasury,
              setup,
              env.journal)
        , escrow(env.escrow(alice))
    {
        env.factory.addLedger(other);
        env.fund(alice, units(10), units(0));
        env.fund(bob, units(0), units(100'000));
        env.fund(env.treasury.account(), units(0), units(1'000'000));
        env.approve(alice, escrow.account());
        env.approve(bob, escrow.account());
        env.treasury.authorize(gatewayAccount);
    }

    std::uint32_t
    request(
        Amount const& interest = percent(5),
        Amount const& ratio = units(2500),
        NetClock::duration duration = days(30))
    {
        auto const id =
            escrow.request(alice, units(2500), interest, ratio, duration);
        REQUIRE(id);
        return *id;
    }

    void
    fund(Amount const& amount = units(10'000))
    {
        REQUIRE(gateway.fund(overseer, amount) == tesSUCCESS);
    }

    TER
    clear(std::uint32_t id)
    {
        auto const loanId = gateway.clear(op, escrow.account(), id, env.now);
        return loanId ? TER{tesSUCCESS} : loanId.error();
    }
};

}  // namespace

TEST_CASE_FIXTURE(GatewayFixture, "fund")
{
    CHECK(gateway.fund(stranger, units(1)) == tecNO_PERMISSION);
    CHECK(gateway.fund(op, units(1)) == tecNO_PERMISSION);
    CHECK(gateway.fund(overseer, Amount(0)) == temBAD_AMOUNT);

    CHECK(gateway.fund(overseer, units(10'000)) == tesSUCCESS);
    CHECK(env.debt.balanceOf(gatewayAccount) == units(10'000));
    CHECK(env.debt.balanceOf(env.treasury.account()) == units(990'000));

    env.treasury.revoke(gatewayAccount);
    CHECK(gateway.fund(overseer, units(1)) == tecNO_PERMISSION);
    CHECK(env.debt.balanceOf(gatewayAccount) == units(10'000));
}

TEST_CASE_FIXTURE(GatewayFixture, "clear within bounds")
{
    fund();
    auto const id = request();

    auto const loanId = gateway.clear(op, escrow.account(), id, env.now);
    REQUIRE(loanId);

    auto const loan = escrow.loan(*loanId);
    REQUIRE(loan);
    CHECK(loan->lender == gatewayAccount.id());
    CHECK(loan->amount == Amount("2510273972602739725000"));
    CHECK(env.debt.balanceOf(alice) == units(2500));
    CHECK(env.debt.balanceOf(gatewayAccount) == units(7500));
    CHECK(env.debt.allowance(gatewayAccount, escrow.account()) == 0);
    CHECK_FALSE(escrow.request(id)->active);
}

TEST_CASE_FIXTURE(GatewayFixture, "clear requires the operator")
{
    fund();
    auto const id = request();

    for (auto const& account : {stranger, overseer, bob})
    {
        auto const loanId = gateway.clear(account, escrow.account(), id, env.now);
        REQUIRE_FALSE(loanId);
        CHECK(loanId.error() == tecNO_PERMISSION);
    }
    CHECK(escrow.request(id)->active);
}

TEST_CASE_FIXTURE(GatewayFixture, "clear requires a genuine escrow")
{
    fund();
    request();

    auto const loanId = gateway.clear(op, AccountID(999), 0, env.now);
    REQUIRE_FALSE(loanId);
    CHECK(loanId.error() == tecUNKNOWN_ESCROW);
    CHECK(errorKind(loanId.error()) == ErrorKind::policyViolation);
}

TEST_CASE_FIXTURE(GatewayFixture, "clear requires the gateway's assets")
{
    fund();

    auto const elsewhere =
        env.factory.generate(alice, env.collateral.asset(), other.asset());
    REQUIRE(elsewhere);
    REQUIRE(*elsewhere != escrow.account());

    auto* const mismatched = env.factory.escrow(*elsewhere);
    REQUIRE(mismatched);
    REQUIRE(env.collateral.approve(alice, *elsewhere, units(10)) == tesSUCCESS);
    auto const id = mismatched->request(
        alice, units(2500), percent(5), units(2500), days(30));
    REQUIRE(id);

    auto const loanId = gateway.clear(op, *elsewhere, *id, env.now);
    REQUIRE_FALSE(loanId);
    CHECK(loanId.error() == tecWRONG_ASSET);
}

TEST_CASE_FIXTURE(GatewayFixture, "clear requires an active request")
{
    fund();

    CHECK(clear(0) == tecNO_ENTRY);

    auto const id = request();
    CHECK(escrow.rescind(alice, id) == tesSUCCESS);
    CHECK(clear(id) == tecREQUEST_INACTIVE);
}

TEST_CASE_FIXTURE(GatewayFixture, "clear enforces the policy bounds")
{
    fund();

    auto const cheap = request(percent(1));
    CHECK(clear(cheap) == tecINTEREST_MINIMUM);
    CHECK(clear(request(percent(2))) == tesSUCCESS);

    auto const leveraged = request(percent(5), units(2501));
    CHECK(clear(leveraged) == tecLTC_MAXIMUM);
    CHECK(clear(request(percent(5), units(2500))) == tesSUCCESS);

    auto const lengthy = request(percent(5), units(2500), days(366));
    CHECK(clear(lengthy) == tecDURATION_MAXIMUM);
    CHECK(clear(request(percent(5), units(2500), days(365))) == tesSUCCESS);

    for (auto const id : {cheap, leveraged, lengthy})
        CHECK(escrow.request(id)->active);

    // The bounds are the gateway's; a lender going direct accepts any terms.
    auto const direct = escrow.clear(bob, cheap, env.now);
    CHECK(direct);
}

TEST_CASE("bounds come from the setup")
{
    Config config;
    config.loadFromString(
        "[risk_gateway]\n"
        "minimum_interest=0.1e18\n");

    GatewayFixture f(setup_RiskGateway(config));
    f.fund();

    CHECK(f.gateway.setup().minimumInterest == percent(10));
    CHECK(f.clear(f.request(percent(5))) == tecINTEREST_MINIMUM);
    CHECK(f.clear(f.request(percent(10))) == tesSUCCESS);
}

TEST_CASE_FIXTURE(GatewayFixture, "failed clear withdraws the allowance")
{
    // The gateway has no funds to lend.
    auto const id = request();

    CHECK(clear(id) == tecUNFUNDED);
    CHECK(env.debt.allowance(gatewayAccount, escrow.account()) == 0);
    CHECK(escrow.request(id)->active);
    CHECK(escrow.loanCount() == 0);
}

TEST_CASE_FIXTURE(GatewayFixture, "toggleRoll")
{
    fund();
    auto const loanId = gateway.clear(op, escrow.account(), request(), env.now);
    REQUIRE(loanId);

    auto const refused = gateway.toggleRoll(stranger, escrow.account(), *loanId);
    REQUIRE_FALSE(refused);
    CHECK(refused.error() == tecNO_PERMISSION);

    auto const unknown = gateway.toggleRoll(op, AccountID(999), *loanId);
    REQUIRE_FALSE(unknown);
    CHECK(unknown.error() == tecUNKNOWN_ESCROW);

    auto const off = gateway.toggleRoll(op, escrow.account(), *loanId);
    REQUIRE(off);
    CHECK_FALSE(*off);
    CHECK_FALSE(escrow.loan(*loanId)->rollable);

    // The gateway is the lender, not the operator.
    auto const direct = escrow.toggleRoll(op, *loanId);
    REQUIRE_FALSE(direct);
    CHECK(direct.error() == tecNO_PERMISSION);
}

TEST_CASE_FIXTURE(GatewayFixture, "defund")
{
    fund();
    auto const treasury = env.treasury.account();

    CHECK(
        gateway.defund(stranger, env.debt.asset(), units(1)) ==
        tecNO_PERMISSION);
    CHECK(gateway.defund(op, other.asset(), units(1)) == tecWRONG_ASSET);

    CHECK(gateway.defund(op, env.debt.asset(), units(1000)) == tesSUCCESS);
    CHECK(
        gateway.defund(overseer, env.debt.asset(), units(1000)) == tesSUCCESS);
    CHECK(env.debt.balanceOf(gatewayAccount) == units(8000));
    CHECK(env.debt.balanceOf(treasury) == units(992'000));

    CHECK(
        gateway.defund(op, env.debt.asset(), units(8001)) == tecUNFUNDED);

    // Collateral seized from a defaulted loan can be returned too.
    auto const loanId = gateway.clear(op, escrow.account(), request(), env.now);
    REQUIRE(loanId);
    auto const expiry = escrow.loan(*loanId)->expiry;
    REQUIRE(escrow.defaulted(
        stranger, *loanId, expiry + NetClock::duration{1}));
    CHECK(env.collateral.balanceOf(gatewayAccount) == scale);

    CHECK(
        gateway.defund(overseer, env.collateral.asset(), scale) == tesSUCCESS);
    CHECK(env.collateral.balanceOf(treasury) == scale);
    CHECK(env.collateral.balanceOf(gatewayAccount) == 0);
}

TEST_CASE_FIXTURE(GatewayFixture, "operator handoff")
{
    fund();

    CHECK(gateway.proposeOperator(stranger, stranger) == tecNO_PERMISSION);
    CHECK(gateway.acceptOperator(bob) == tecNO_PERMISSION);

    CHECK(gateway.proposeOperator(op, bob) == tesSUCCESS);
    REQUIRE(gateway.pendingOperator());
    CHECK(*gateway.pendingOperator() == bob.id());

    // A later proposal replaces the earlier one.
    CHECK(gateway.proposeOperator(op, stranger) == tesSUCCESS);
    CHECK(gateway.acceptOperator(bob) == tecNO_PERMISSION);
    CHECK(gateway.operatorAccount() == op.id());

    CHECK(gateway.acceptOperator(stranger) == tesSUCCESS);
    CHECK(gateway.operatorAccount() == stranger.id());
    CHECK_FALSE(gateway.pendingOperator());
    CHECK(gateway.acceptOperator(stranger) == tecNO_PERMISSION);

    auto const id = request();
    auto const old = gateway.clear(op, escrow.account(), id, env.now);
    REQUIRE_FALSE(old);
    CHECK(old.error() == tecNO_PERMISSION);
    CHECK(gateway.clear(stranger, escrow.account(), id, env.now));
}

TEST_CASE_FIXTURE(GatewayFixture, "overseer handoff")
{
    CHECK(gateway.proposeOverseer(op, op) == tecNO_PERMISSION);

    CHECK(gateway.proposeOverseer(overseer, bob) == tesSUCCESS);
    REQUIRE(gateway.pendingOverseer());
    CHECK(*gateway.pendingOverseer() == bob.id());
    CHECK(gateway.acceptOverseer(stranger) == tecNO_PERMISSION);
    CHECK(gateway.acceptOverseer(bob) == tesSUCCESS);
    CHECK(gateway.overseer() == bob.id());
    CHECK_FALSE(gateway.pendingOverseer());

    CHECK(gateway.fund(overseer, units(1)) == tecNO_PERMISSION);
    CHECK(gateway.fund(bob, units(1)) == tesSUCCESS);
    CHECK(gateway.defund(overseer, env.debt.asset(), units(1)) == tecNO_PERMISSION);
    CHECK(gateway.defund(bob, env.debt.asset(), units(1)) == tesSUCCESS);
}

TEST_SUITE_END();
