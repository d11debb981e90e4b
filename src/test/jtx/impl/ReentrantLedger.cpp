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

#include <test/jtx/ReentrantLedger.h>

#include <utility>

namespace cooler {
namespace test {
namespace jtx {

ReentrantLedger::ReentrantLedger(AssetID const& asset) : TestLedger(asset)
{
}

TER
ReentrantLedger::transfer(
    AccountID const& from,
    AccountID const& to,
    Amount const& amount)
{
    callHook();
    return TestLedger::transfer(from, to, amount);
}

TER
ReentrantLedger::transferFrom(
    AccountID const& spender,
    AccountID const& from,
    AccountID const& to,
    Amount const& amount)
{
    callHook();
    return TestLedger::transferFrom(spender, from, to, amount);
}

void
ReentrantLedger::callHook()
{
    // Cleared first so the hook cannot trigger itself.
    auto hook = std::exchange(hook_, nullptr);
    if (hook)
        hook();
}

}  // namespace jtx
}  // namespace test
}  // namespace cooler
