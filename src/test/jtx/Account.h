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

#ifndef COOLER_TEST_JTX_ACCOUNT_H_INCLUDED
#define COOLER_TEST_JTX_ACCOUNT_H_INCLUDED

#include <cooler/protocol/AccountID.h>

#include <cstdint>
#include <string>
#include <utility>

namespace cooler {
namespace test {
namespace jtx {

/** A named participant in a test. */
class Account
{
private:
    std::string name_;
    AccountID id_;

public:
    Account(std::string name, std::uint64_t id)
        : name_(std::move(name)), id_(id)
    {
    }

    std::string const&
    name() const
    {
        return name_;
    }

    AccountID const&
    id() const
    {
        return id_;
    }

    /** Implicit conversion makes an Account usable wherever an AccountID
        is expected. */
    operator AccountID const&() const
    {
        return id_;
    }
};

}  // namespace jtx
}  // namespace test
}  // namespace cooler

#endif
