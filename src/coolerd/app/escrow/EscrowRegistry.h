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

#ifndef COOLER_APP_ESCROW_ESCROWREGISTRY_H_INCLUDED
#define COOLER_APP_ESCROW_ESCROWREGISTRY_H_INCLUDED

#include <cooler/basics/Expected.h>
#include <cooler/protocol/AccountID.h>
#include <cooler/protocol/TER.h>

namespace cooler {

class Escrow;

/** Creates escrows and vouches for the ones it created.

    Anyone can stand up something that looks like an escrow. Callers that
    move assets on an escrow's behalf ask the registry first.
*/
class EscrowRegistry
{
public:
    virtual ~EscrowRegistry() = default;

    /** Return the escrow for (owner, collateral, debt), creating it on first
        use. Asking twice yields the same escrow.
    */
    virtual Expected<AccountID, TER>
    generate(
        AccountID const& owner,
        AssetID const& collateral,
        AssetID const& debt) = 0;

    /** True if `escrow` was created by this registry. */
    virtual bool
    isGenuine(AccountID const& escrow) const = 0;

    /** @return The escrow, or nullptr if this registry did not create it. */
    virtual Escrow*
    escrow(AccountID const& escrow) const = 0;
};

}  // namespace cooler

#endif
