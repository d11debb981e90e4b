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

#ifndef COOLER_PROTOCOL_TER_H_INCLUDED
#define COOLER_PROTOCOL_TER_H_INCLUDED

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace cooler {

// "Transaction Engine Result"
// or Transaction ERror.
//
// Every escrow and gateway operation reports its outcome as one of these
// codes. The ranges follow the ledger convention:
//
//   tem: malformed input, can never succeed as submitted
//   tef: internal failure, an invariant of the engine does not hold
//   tes: success
//   tec: the operation was understood and refused by the current state
//
using TERUnderlyingType = int;

//------------------------------------------------------------------------------

enum TEMcodes : TERUnderlyingType {
    // -299 .. -200: M Malformed
    // Causes:
    // - Arguments that no ledger state could make acceptable.
    // Implications:
    // - Not applied
    // - Cannot succeed in any imagined ledger.
    temMALFORMED = -299,

    temBAD_AMOUNT,
    temBAD_RATIO,
};

//------------------------------------------------------------------------------

enum TEFcodes : TERUnderlyingType {
    // -199 .. -100: F
    //    Failure (the engine found itself in a state it does not expect)
    //
    // Causes:
    // - An invariant between the escrow ledgers and the asset ledger broke.
    // - A collaborator called back into an escrow mid-operation.
    // Implications:
    // - Not applied
    // - Indicates a bug or a misbehaving collaborator.
    tefFAILURE = -199,
    tefBAD_LEDGER,
    tefINTERNAL,
    tefREENTRANT,
};

//------------------------------------------------------------------------------

enum TEScodes : TERUnderlyingType {
    // 0: S Success (success)
    // Causes:
    // - Success.
    // Implications:
    // - Applied
    tesSUCCESS = 0
};

//------------------------------------------------------------------------------

enum TECcodes : TERUnderlyingType {
    // 100 .. 255 C
    //   Claimed failure
    //
    // Causes:
    // - The operation was well formed but the current state refuses it.
    // Implications:
    // - Not applied, no state changed and no asset moved.
    //
    // DO NOT CHANGE THESE NUMBERS: They appear in logs and operator tooling.
    tecCLAIM = 100,
    tecUNFUNDED = 101,
    tecNO_AUTH = 102,
    tecNO_PERMISSION = 103,
    tecNO_ENTRY = 104,
    tecREQUEST_INACTIVE = 105,
    tecEXPIRED = 106,
    tecTOO_SOON = 107,
    tecNOT_ROLLABLE = 108,
    tecINTEREST_MINIMUM = 109,
    tecLTC_MAXIMUM = 110,
    tecDURATION_MAXIMUM = 111,
    tecWRONG_ASSET = 112,
    tecUNKNOWN_ESCROW = 113,
    tecOVERPAYMENT = 114,
    tecOVERFLOW = 115,
};

//------------------------------------------------------------------------------

// For generic purposes, a free function that returns the value of a TE*codes.
constexpr TERUnderlyingType
TERtoInt(TEMcodes v)
{
    return static_cast<TERUnderlyingType>(v);
}

constexpr TERUnderlyingType
TERtoInt(TEFcodes v)
{
    return static_cast<TERUnderlyingType>(v);
}

constexpr TERUnderlyingType
TERtoInt(TEScodes v)
{
    return static_cast<TERUnderlyingType>(v);
}

constexpr TERUnderlyingType
TERtoInt(TECcodes v)
{
    return static_cast<TERUnderlyingType>(v);
}

//------------------------------------------------------------------------------
// Template class that is specific to selected ranges of error codes.  The
// Trait tells std::enable_if which ranges are allowed.
template <template <typename> class Trait>
class TERSubset
{
    TERUnderlyingType code_;

public:
    // Constructors
    constexpr TERSubset() : code_(tesSUCCESS)
    {
    }
    constexpr TERSubset(TERSubset const& rhs) = default;
    constexpr TERSubset(TERSubset&& rhs) = default;

private:
    constexpr explicit TERSubset(int rhs) : code_(rhs)
    {
    }

public:
    static constexpr TERSubset
    fromInt(int from)
    {
        return TERSubset(from);
    }

    // Trait tells enable_if which types are allowed for construction.
    template <
        typename T,
        typename = std::enable_if_t<
            Trait<std::remove_cv_t<std::remove_reference_t<T>>>::value>>
    constexpr TERSubset(T rhs) : code_(TERtoInt(rhs))
    {
    }

    // Assignment
    constexpr TERSubset&
    operator=(TERSubset const& rhs) = default;
    constexpr TERSubset&
    operator=(TERSubset&& rhs) = default;

    // Trait tells enable_if which types are allowed for assignment.
    template <typename T>
    constexpr auto
    operator=(T rhs) -> std::enable_if_t<Trait<T>::value, TERSubset&>
    {
        code_ = TERtoInt(rhs);
        return *this;
    }

    // Conversion to bool.  True for anything but success, so that
    //     if (auto const ter = doSomething()) return ter;
    // propagates failures.
    explicit
    operator bool() const
    {
        return code_ != tesSUCCESS;
    }

    // Streaming operator.
    friend std::ostream&
    operator<<(std::ostream& os, TERSubset const& rhs)
    {
        return os << rhs.code_;
    }

    // Return the underlying value.  Not a member so similarly named free
    // functions can do the same work for the enums.
    //
    // An explicit conversion operator would let a TER silently become an
    // int in constructors taking one, so only a named conversion exists.
    friend constexpr TERUnderlyingType
    TERtoInt(TERSubset v)
    {
        return v.code_;
    }
};

// Comparison operators.
// Only enabled if both arguments return int if TERtoInt is called with them.
template <typename L, typename R>
constexpr auto
operator==(L const& lhs, R const& rhs) -> std::enable_if_t<
    std::is_same<decltype(TERtoInt(lhs)), int>::value &&
        std::is_same<decltype(TERtoInt(rhs)), int>::value,
    bool>
{
    return TERtoInt(lhs) == TERtoInt(rhs);
}

template <typename L, typename R>
constexpr auto
operator!=(L const& lhs, R const& rhs) -> std::enable_if_t<
    std::is_same<decltype(TERtoInt(lhs)), int>::value &&
        std::is_same<decltype(TERtoInt(rhs)), int>::value,
    bool>
{
    return TERtoInt(lhs) != TERtoInt(rhs);
}

template <typename L, typename R>
constexpr auto
operator<(L const& lhs, R const& rhs) -> std::enable_if_t<
    std::is_same<decltype(TERtoInt(lhs)), int>::value &&
        std::is_same<decltype(TERtoInt(rhs)), int>::value,
    bool>
{
    return TERtoInt(lhs) < TERtoInt(rhs);
}

template <typename L, typename R>
constexpr auto
operator<=(L const& lhs, R const& rhs) -> std::enable_if_t<
    std::is_same<decltype(TERtoInt(lhs)), int>::value &&
        std::is_same<decltype(TERtoInt(rhs)), int>::value,
    bool>
{
    return TERtoInt(lhs) <= TERtoInt(rhs);
}

template <typename L, typename R>
constexpr auto
operator>(L const& lhs, R const& rhs) -> std::enable_if_t<
    std::is_same<decltype(TERtoInt(lhs)), int>::value &&
        std::is_same<decltype(TERtoInt(rhs)), int>::value,
    bool>
{
    return TERtoInt(lhs) > TERtoInt(rhs);
}

template <typename L, typename R>
constexpr auto
operator>=(L const& lhs, R const& rhs) -> std::enable_if_t<
    std::is_same<decltype(TERtoInt(lhs)), int>::value &&
        std::is_same<decltype(TERtoInt(rhs)), int>::value,
    bool>
{
    return TERtoInt(lhs) >= TERtoInt(rhs);
}

//------------------------------------------------------------------------------
// Use traits to build a TERSubset that can convert from any of the TE*codes
// enums.
template <typename FROM>
class CanCvtToTER : public std::false_type
{
};
template <>
class CanCvtToTER<TEMcodes> : public std::true_type
{
};
template <>
class CanCvtToTER<TEFcodes> : public std::true_type
{
};
template <>
class CanCvtToTER<TEScodes> : public std::true_type
{
};
template <>
class CanCvtToTER<TECcodes> : public std::true_type
{
};

using TER = TERSubset<CanCvtToTER>;

//------------------------------------------------------------------------------

inline bool
isTemMalformed(TER x)
{
    return (x >= temMALFORMED && x < tefFAILURE);
}

inline bool
isTefFailure(TER x)
{
    return (x >= tefFAILURE && x < tesSUCCESS);
}

inline bool
isTesSuccess(TER x)
{
    return (x == tesSUCCESS);
}

inline bool
isTecClaim(TER x)
{
    return (x >= tecCLAIM);
}

//------------------------------------------------------------------------------

/** The broad kinds of failure a caller has to distinguish.

    Several codes share a kind: a caller deciding whether to retry later,
    fix its inputs, or give up only needs the kind, while logs and tests use
    the precise code.
*/
enum class ErrorKind {
    none,
    // The caller is not the identity the operation requires.
    unauthorized,
    // A request or loan is absent, inactive, or closed.
    invalidState,
    // The loan is past expiry and the operation needs it current.
    defaultViolation,
    // The loan is not yet past expiry and the operation needs it expired.
    noDefaultViolation,
    // The lender has disabled rollover.
    notRollable,
    // A protocol bound or arithmetic precondition is breached.
    policyViolation,
    // The asset ledger refused a transfer.
    transferFailure,
    // The engine's own invariants failed.
    internal
};

ErrorKind
errorKind(TER code);

std::unordered_map<
    TERUnderlyingType,
    std::pair<char const* const, char const* const>> const&
transResults();

bool
transResultInfo(TER code, std::string& token, std::string& text);

std::string
transToken(TER code);

std::string
transHuman(TER code);

std::optional<TER>
transCode(std::string const& token);

}  // namespace cooler

#endif
