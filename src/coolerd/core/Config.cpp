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

#include <coolerd/core/Config.h>

#include <cooler/basics/Journal.h>
#include <cooler/basics/contract.h>

#include <boost/lexical_cast.hpp>

#include <cstdint>
#include <stdexcept>

namespace cooler {

void
Config::loadFromString(std::string const& fileContents)
{
    IniFileSections secConfig = parseIniFile(fileContents, true);

    build(secConfig);

    if (had_trailing_comments())
    {
        JLOG(debugLog().warn())
            << "Unescaped '#' in configuration values; "
               "text after it was treated as a comment.";
    }
}

namespace {

void
setAmount(Amount& target, std::string const& name, Section const& section)
{
    auto const text = section.get(name);
    if (!text)
        return;

    auto const amount = parseAmount(*text);
    if (!amount)
        Throw<std::runtime_error>(
            "Invalid " + name + " in [" SECTION_RISK_GATEWAY "]: " + *text);

    target = *amount;
}

void
setDuration(
    NetClock::duration& target,
    std::string const& name,
    Section const& section)
{
    auto const text = section.get(name);
    if (!text)
        return;

    // lexical_cast wraps negative values into unsigned targets
    if (text->empty() ||
        text->find_first_not_of("0123456789") != std::string::npos)
        Throw<std::runtime_error>(
            "Invalid " + name + " in [" SECTION_RISK_GATEWAY "]: " + *text);

    try
    {
        target = NetClock::duration{boost::lexical_cast<NetClock::rep>(*text)};
    }
    catch (boost::bad_lexical_cast const&)
    {
        Throw<std::runtime_error>(
            "Invalid " + name + " in [" SECTION_RISK_GATEWAY "]: " + *text);
    }
}

}  // namespace

RiskGatewaySetup
setup_RiskGateway(Config const& config)
{
    RiskGatewaySetup setup;

    auto const& section = config.section(SECTION_RISK_GATEWAY);
    setAmount(setup.minimumInterest, "minimum_interest", section);
    setAmount(setup.maxLoanToCollateral, "max_loan_to_collateral", section);
    setDuration(setup.maxDuration, "max_duration", section);

    return setup;
}

}  // namespace cooler
