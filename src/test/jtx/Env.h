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

#ifndef COOLER_TEST_JTX_ENV_H_INCLUDED
#define COOLER_TEST_JTX_ENV_H_INCLUDED

#include <test/jtx/Account.h>
#include <test/jtx/TestLedger.h>
#include <test/jtx/TestTreasury.h>

#include <coolerd/app/escrow/Escrow.h>
#include <coolerd/app/escrow/EscrowFactory.h>

#include <cooler/basics/Journal.h>
#include <cooler/basics/chrono.h>
#include <cooler/protocol/Amount.h>

#include <chrono>
#include <cstdint>
#include <sstream>

namespace cooler {
namespace test {
namespace jtx {

/** `n` whole units of an asset. */
Amount
units(std::uint64_t n);

/** An annual rate of `n` percent. */
Amount
percent(std::uint64_t n);

NetClock::duration
days(std::uint32_t n);

/** A self-contained lending environment.

    Two asset ledgers (collateral and debt), a treasury that can pay out of
    both, and a factory that knows both ledgers. Everything logs at trace
    level into `log`.
*/
class Env
{
public:
    std::ostringstream log;

private:
    StreamSink sink_;

public:
    Journal const journal;
    TestLedger collateral;
    TestLedger debt;
    TestTreasury treasury;
    EscrowFactory factory;
    NetClock::time_point now;

    Env();

    Env(Env const&) = delete;
    Env&
    operator=(Env const&) = delete;

    /** Credit `account` with collateral and debt. */
    void
    fund(
        AccountID const& account,
        Amount const& collateralAmount,
        Amount const& debtAmount);

    /** Let `spender` pull any amount of either asset from `owner`. */
    void
    approve(AccountID const& owner, AccountID const& spender);

    /** The escrow `owner` borrows through, created on first use. */
    Escrow&
    escrow(AccountID const& owner);

    /** Advance the clock. */
    void
    close(NetClock::duration elapsed)
    {
        now += elapsed;
    }
};

}  // namespace jtx
}  // namespace test
}  // namespace cooler

#endif
