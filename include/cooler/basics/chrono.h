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

#ifndef COOLER_BASICS_CHRONO_H_INCLUDED
#define COOLER_BASICS_CHRONO_H_INCLUDED

#include <chrono>
#include <cstdint>
#include <ratio>
#include <string>

namespace cooler {

/** Clock for measuring the network time.

    The epoch is January 1, 1970. The resolution is one second, which is
    as fine as any lending decision needs to be.
*/
class NetClock
{
public:
    explicit NetClock() = default;

    using rep = std::uint32_t;
    using period = std::ratio<1>;
    using duration = std::chrono::duration<rep, period>;
    using time_point = std::chrono::time_point<NetClock>;

    static bool const is_steady = false;
};

template <class Duration>
std::string
to_string(std::chrono::time_point<NetClock, Duration> tp)
{
    return std::to_string(tp.time_since_epoch().count());
}

}  // namespace cooler

#endif
