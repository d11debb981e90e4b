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

#include <cooler/protocol/TER.h>

#include <boost/range/adaptor/transformed.hpp>
#include <boost/range/iterator_range_core.hpp>

#include <type_traits>

namespace cooler {

std::unordered_map<
    TERUnderlyingType,
    std::pair<char const* const, char const* const>> const&
transResults()
{
    // clang-format off

    // Macros are convenient because they make sure the token and the
    // code stay in sync.
#pragma push_macro("MAKE_ERROR")
#undef MAKE_ERROR

#define MAKE_ERROR(code, desc) { code, { #code, desc } }

    static
    std::unordered_map<
        TERUnderlyingType,
        std::pair<char const* const, char const* const>> const results
    {
        MAKE_ERROR(temMALFORMED,          "Malformed operation."),
        MAKE_ERROR(temBAD_AMOUNT,         "Malformed: Amount must be positive."),
        MAKE_ERROR(temBAD_RATIO,          "Malformed: Loan-to-collateral ratio must be positive."),

        MAKE_ERROR(tefFAILURE,            "Failed to apply."),
        MAKE_ERROR(tefBAD_LEDGER,         "Escrow ledger is in an unexpected state."),
        MAKE_ERROR(tefINTERNAL,           "Internal error."),
        MAKE_ERROR(tefREENTRANT,          "Escrow is already processing an operation."),

        MAKE_ERROR(tesSUCCESS,            "The operation was applied."),

        MAKE_ERROR(tecCLAIM,              "Operation refused."),
        MAKE_ERROR(tecUNFUNDED,           "Insufficient balance to complete the transfer."),
        MAKE_ERROR(tecNO_AUTH,            "Insufficient allowance to complete the transfer."),
        MAKE_ERROR(tecNO_PERMISSION,      "Caller is not authorized for this operation."),
        MAKE_ERROR(tecNO_ENTRY,           "No request or loan with that id."),
        MAKE_ERROR(tecREQUEST_INACTIVE,   "Request is no longer active."),
        MAKE_ERROR(tecEXPIRED,            "Loan is past its expiry."),
        MAKE_ERROR(tecTOO_SOON,           "Loan has not expired yet."),
        MAKE_ERROR(tecNOT_ROLLABLE,       "Lender has disabled rollover for this loan."),
        MAKE_ERROR(tecINTEREST_MINIMUM,   "Interest rate is below the gateway minimum."),
        MAKE_ERROR(tecLTC_MAXIMUM,        "Loan-to-collateral ratio is above the gateway maximum."),
        MAKE_ERROR(tecDURATION_MAXIMUM,   "Duration is above the gateway maximum."),
        MAKE_ERROR(tecWRONG_ASSET,        "Asset is not handled by this gateway."),
        MAKE_ERROR(tecUNKNOWN_ESCROW,     "Escrow was not created by the registry."),
        MAKE_ERROR(tecOVERPAYMENT,        "Repayment exceeds the outstanding debt."),
        MAKE_ERROR(tecOVERFLOW,           "Arithmetic overflow."),
    };
    // clang-format on

#undef MAKE_ERROR
#pragma pop_macro("MAKE_ERROR")

    return results;
}

bool
transResultInfo(TER code, std::string& token, std::string& text)
{
    auto& results = transResults();

    auto const r = results.find(TERtoInt(code));

    if (r == results.end())
        return false;

    token = r->second.first;
    text = r->second.second;
    return true;
}

std::string
transToken(TER code)
{
    std::string token;
    std::string text;

    return transResultInfo(code, token, text) ? token : "-";
}

std::string
transHuman(TER code)
{
    std::string token;
    std::string text;

    return transResultInfo(code, token, text) ? text : "-";
}

std::optional<TER>
transCode(std::string const& token)
{
    static auto const results = [] {
        auto& byTer = transResults();
        auto range = boost::make_iterator_range(byTer.begin(), byTer.end());
        auto tRange = boost::adaptors::transform(range, [](auto const& r) {
            return std::make_pair(r.second.first, r.first);
        });
        std::unordered_map<std::string, TERUnderlyingType> const byToken(
            tRange.begin(), tRange.end());
        return byToken;
    }();

    auto const r = results.find(token);

    if (r == results.end())
        return std::nullopt;

    return TER::fromInt(r->second);
}

ErrorKind
errorKind(TER code)
{
    switch (TERtoInt(code))
    {
        case tesSUCCESS:
            return ErrorKind::none;
        case tecNO_PERMISSION:
            return ErrorKind::unauthorized;
        case tecNO_ENTRY:
        case tecREQUEST_INACTIVE:
            return ErrorKind::invalidState;
        case tecEXPIRED:
            return ErrorKind::defaultViolation;
        case tecTOO_SOON:
            return ErrorKind::noDefaultViolation;
        case tecNOT_ROLLABLE:
            return ErrorKind::notRollable;
        case tecINTEREST_MINIMUM:
        case tecLTC_MAXIMUM:
        case tecDURATION_MAXIMUM:
        case tecWRONG_ASSET:
        case tecUNKNOWN_ESCROW:
        case tecOVERPAYMENT:
        case tecOVERFLOW:
        case temBAD_RATIO:
        case temBAD_AMOUNT:
            return ErrorKind::policyViolation;
        case tecUNFUNDED:
        case tecNO_AUTH:
            return ErrorKind::transferFailure;
        default:
            break;
    }
    return ErrorKind::internal;
}

}  // namespace cooler
