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

#include <cooler/protocol/Amount.h>

#include <boost/algorithm/string/trim.hpp>
#include <boost/regex.hpp>

#include <stdexcept>

namespace cooler {

std::optional<Amount>
parseAmount(std::string const& text)
{
    static boost::regex const re(
        "^"                      // the beginning of the string
        "([0-9]+)"               // one or more digits
        "(?:\\.([0-9]*))?"       // optional fraction
        "(?:[eE]\\+?([0-9]+))?"  // optional exponent
        "$",                     // the end of the string
        boost::regex_constants::optimize);

    boost::smatch match;
    auto const trimmed = boost::algorithm::trim_copy(text);

    if (!boost::regex_match(trimmed, match, re))
        return std::nullopt;

    std::string digits = match[1];
    std::string fraction = match[2].matched ? match[2].str() : std::string{};
    std::size_t exponent = 0;

    if (match[3].matched)
    {
        // More places than 256 bits can ever hold
        if (match[3].length() > 3)
            return std::nullopt;
        exponent = std::stoul(match[3]);
    }

    // Shift the fraction into the integer part. Digits the exponent cannot
    // absorb must all be zero.
    if (fraction.size() > exponent)
    {
        if (fraction.find_first_not_of('0', exponent) != std::string::npos)
            return std::nullopt;
        fraction.resize(exponent);
    }
    exponent -= fraction.size();
    digits += fraction;

    try
    {
        Amount result = 0;
        for (auto const c : digits)
            result = result * 10 + (c - '0');
        for (std::size_t i = 0; i < exponent; ++i)
            result *= 10;
        return result;
    }
    catch (std::overflow_error const&)
    {
        return std::nullopt;
    }
}

std::string
to_string(Amount const& amount)
{
    return amount.str();
}

}  // namespace cooler
