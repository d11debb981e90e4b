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

#ifndef COOLER_CORE_CONFIG_H_INCLUDED
#define COOLER_CORE_CONFIG_H_INCLUDED

#include <cooler/basics/BasicConfig.h>
#include <cooler/basics/chrono.h>
#include <cooler/protocol/Amount.h>
#include <cooler/protocol/Protocol.h>

#include <string>

#define SECTION_RISK_GATEWAY "risk_gateway"

namespace cooler {

/** Bounds a RiskGateway holds every request it clears to. */
struct RiskGatewaySetup
{
    /** The lowest annualized interest rate accepted, at `scale`. */
    Amount minimumInterest = defaultMinimumInterest;

    /** The highest loan-to-collateral ratio accepted, at `scale`. */
    Amount maxLoanToCollateral = defaultMaxLoanToCollateral;

    /** The longest tenor accepted. */
    NetClock::duration maxDuration = defaultMaxDuration;

    /* (Remember to update the example cfg when changing any of these
     * values.) */
};

class Config : public BasicConfig
{
public:
    /** Add the sections and values in the text of an ini file. */
    void
    loadFromString(std::string const& fileContents);
};

/** Read the [risk_gateway] section.

    Keys that are absent keep their defaults. A key that is present but
    does not parse throws std::runtime_error naming the key.
*/
RiskGatewaySetup
setup_RiskGateway(Config const& config);

}  // namespace cooler

#endif
