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

#ifndef COOLER_APP_GATEWAY_TREASURY_H_INCLUDED
#define COOLER_APP_GATEWAY_TREASURY_H_INCLUDED

#include <cooler/protocol/AccountID.h>
#include <cooler/protocol/Amount.h>
#include <cooler/protocol/TER.h>

namespace cooler {

/** The source of the funds a gateway lends.

    The treasury decides for itself whether a caller may draw on it; a
    gateway only asks.
*/
class Treasury
{
public:
    virtual ~Treasury() = default;

    /** The account funds are returned to. */
    virtual AccountID
    account() const = 0;

    /** Move `amount` of `asset` to `recipient`. */
    virtual TER
    manage(
        AccountID const& recipient,
        AssetID const& asset,
        Amount const& amount) = 0;
};

}  // namespace cooler

#endif
