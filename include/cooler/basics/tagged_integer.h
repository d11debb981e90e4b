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

#ifndef COOLER_BASICS_TAGGED_INTEGER_H_INCLUDED
#define COOLER_BASICS_TAGGED_INTEGER_H_INCLUDED

#include <boost/container_hash/hash.hpp>
#include <boost/operators.hpp>

#include <functional>
#include <iostream>
#include <type_traits>

namespace cooler {

/** A type-safe wrap around standard integral types

    The tag is used to implement type safety, catching mismatched types at
    compile time. Multiple instantiations wrapping the same underlying integral
    type are distinct types (distinguished by tag) and will not interoperate.

    Only comparison is provided: the wrapped values are identities, and
    arithmetic on them has no meaning.
*/
template <class Int, class Tag>
class tagged_integer : boost::totally_ordered<tagged_integer<Int, Tag>>
{
private:
    Int m_value;

public:
    using value_type = Int;
    using tag_type = Tag;

    tagged_integer() = default;

    template <
        class OtherInt,
        class = typename std::enable_if<
            std::is_integral<OtherInt>::value &&
            sizeof(OtherInt) <= sizeof(Int)>::type>
    explicit constexpr tagged_integer(OtherInt value) noexcept
        : m_value(value)
    {
        static_assert(
            sizeof(tagged_integer) == sizeof(Int),
            "tagged_integer is adding padding");
    }

    bool
    operator<(tagged_integer const& rhs) const noexcept
    {
        return m_value < rhs.m_value;
    }

    bool
    operator==(tagged_integer const& rhs) const noexcept
    {
        return m_value == rhs.m_value;
    }

    constexpr Int
    value() const noexcept
    {
        return m_value;
    }

    friend std::ostream&
    operator<<(std::ostream& s, tagged_integer const& t)
    {
        s << t.m_value;
        return s;
    }

    friend std::istream&
    operator>>(std::istream& s, tagged_integer& t)
    {
        s >> t.m_value;
        return s;
    }

    friend std::size_t
    hash_value(tagged_integer const& t) noexcept
    {
        return boost::hash<Int>{}(t.m_value);
    }
};

}  // namespace cooler

namespace std {

template <class Int, class Tag>
struct hash<cooler::tagged_integer<Int, Tag>>
{
    std::size_t
    operator()(cooler::tagged_integer<Int, Tag> const& t) const noexcept
    {
        return hash_value(t);
    }
};

}  // namespace std

#endif
