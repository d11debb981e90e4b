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

#ifndef COOLER_PROTOCOL_ACCOUNTID_H_INCLUDED
#define COOLER_PROTOCOL_ACCOUNTID_H_INCLUDED

#include <cooler/basics/tagged_integer.h>

#include <cstdint>
#include <string>

namespace cooler {

namespace detail {

class AccountIDTag
{
public:
    explicit AccountIDTag() = default;
};

class AssetIDTag
{
public:
    explicit AssetIDTag() = default;
};

}  // namespace detail

/** A 64-bit identity for a borrower, lender, escrow, gateway or treasury.

    Escrows and gateways hold assets in their own right, so they carry an
    AccountID like any other participant.
*/
using AccountID = tagged_integer<std::uint64_t, detail::AccountIDTag>;

/** Identifies one fungible asset, and so one AssetLedger. */
using AssetID = tagged_integer<std::uint64_t, detail::AssetIDTag>;

/** A special account that's used as the "issuer" of nothing.
    Never holds a balance and never authorizes anything.
*/
AccountID const&
noAccount();

/** Render an account as a fixed-width hex string, such as "c0000000000000a1". */
std::string
to_string(AccountID const& account);

}  // namespace cooler

#endif
