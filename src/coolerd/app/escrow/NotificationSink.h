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

#ifndef COOLER_APP_ESCROW_NOTIFICATIONSINK_H_INCLUDED
#define COOLER_APP_ESCROW_NOTIFICATIONSINK_H_INCLUDED

#include <cooler/protocol/AccountID.h>

#include <cstdint>
#include <string>

namespace cooler {

enum class EscrowEvent { requested, rescinded, cleared };

inline std::string
to_string(EscrowEvent event)
{
    switch (event)
    {
        case EscrowEvent::requested:
            return "requested";
        case EscrowEvent::rescinded:
            return "rescinded";
        case EscrowEvent::cleared:
            return "cleared";
    }
    return "unknown";
}

/** Receives lifecycle events from escrows.

    Delivery is fire and forget: a sink cannot fail or veto the operation
    that produced the event.
*/
class NotificationSink
{
public:
    virtual ~NotificationSink() = default;

    /** Called after an escrow operation has applied.

        @param escrow The account of the escrow that applied the operation.
        @param id The request id the event concerns.
        @param event What happened to the request.
    */
    virtual void
    notify(AccountID const& escrow, std::uint32_t id, EscrowEvent event) = 0;
};

}  // namespace cooler

#endif
