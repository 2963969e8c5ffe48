//------------------------------------------------------------------------------
/*
    This file is part of trustnet, derived from rippled:
    https://github.com/ripple/rippled
    Copyright (c) 2012-2024 Ripple Labs Inc.

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

#ifndef TRUSTNET_BASICS_BASE_UINT_H_INCLUDED
#define TRUSTNET_BASICS_BASE_UINT_H_INCLUDED

#include <trustnet/basics/strHex.h>

#include <boost/container_hash/hash.hpp>

#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace trustnet {

/** Integers of any length that is a multiple of 32-bits.

    The bytes are stored big-endian, so the natural ordering of the
    value is the lexicographic ordering of its bytes. This is the total
    order used to canonicalize pairs of identifiers.

    @note The Tag parameter prevents values of unrelated meaning (for
          example an account identifier and a ledger key) from being
          mixed by accident.
*/
template <std::size_t Bits, class Tag = void>
class base_uint
{
    static_assert(
        (Bits % 32) == 0,
        "The length of a base_uint in bits must be a multiple of 32.");

    static_assert(
        Bits >= 64,
        "The length of a base_uint in bits must be at least 64.");

public:
    static std::size_t constexpr bytes = Bits / 8;

private:
    std::array<std::uint8_t, bytes> data_;

public:
    using size_type = std::size_t;
    using value_type = unsigned char;
    using pointer = value_type*;
    using const_pointer = value_type const*;
    using iterator = pointer;
    using const_iterator = const_pointer;
    using tag_type = Tag;

    pointer
    data()
    {
        return data_.data();
    }
    const_pointer
    data() const
    {
        return data_.data();
    }

    iterator
    begin()
    {
        return data();
    }
    iterator
    end()
    {
        return data() + bytes;
    }
    const_iterator
    begin() const
    {
        return data();
    }
    const_iterator
    end() const
    {
        return data() + bytes;
    }

    constexpr static std::size_t
    size()
    {
        return bytes;
    }

    constexpr base_uint() : data_{}
    {
    }

    /* Construct from a raw pointer.
        The buffer pointed to by `data` must be at least Bits/8 bytes.
    */
    static base_uint
    fromVoid(void const* data)
    {
        base_uint ret;
        std::memcpy(ret.data_.data(), data, bytes);
        return ret;
    }

    constexpr int
    signum() const
    {
        for (auto const b : data_)
            if (b != 0)
                return 1;
        return 0;
    }

    bool
    isZero() const
    {
        return signum() == 0;
    }

    bool
    isNonZero() const
    {
        return signum() != 0;
    }

    bool
    operator!() const
    {
        return isZero();
    }

    /** Parse a hex string into a base_uint.

        The input must contain exactly 2 * bytes hexadecimal characters,
        in either case.

        @return true if the parse succeeds, false otherwise. On failure
                the value is left unchanged.
    */
    [[nodiscard]] bool
    parseHex(std::string_view sv)
    {
        if (sv.size() != 2 * bytes)
            return false;

        auto nibble = [](char c) -> int {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        };

        decltype(data_) out{};
        for (std::size_t i = 0; i < bytes; ++i)
        {
            int const hi = nibble(sv[2 * i]);
            int const lo = nibble(sv[2 * i + 1]);
            if (hi < 0 || lo < 0)
                return false;
            out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
        }
        data_ = out;
        return true;
    }

    template <class Hasher>
    friend void
    hash_append(Hasher& h, base_uint const& a) noexcept
    {
        h(a.data_.data(), sizeof(a.data_));
    }
};

using uint128 = base_uint<128>;
using uint256 = base_uint<256>;

template <std::size_t Bits, class Tag>
inline int
compare(base_uint<Bits, Tag> const& a, base_uint<Bits, Tag> const& b)
{
    return std::memcmp(a.data(), b.data(), base_uint<Bits, Tag>::bytes);
}

template <std::size_t Bits, class Tag>
inline bool
operator<(base_uint<Bits, Tag> const& a, base_uint<Bits, Tag> const& b)
{
    return compare(a, b) < 0;
}

template <std::size_t Bits, class Tag>
inline bool
operator<=(base_uint<Bits, Tag> const& a, base_uint<Bits, Tag> const& b)
{
    return compare(a, b) <= 0;
}

template <std::size_t Bits, class Tag>
inline bool
operator>(base_uint<Bits, Tag> const& a, base_uint<Bits, Tag> const& b)
{
    return compare(a, b) > 0;
}

template <std::size_t Bits, class Tag>
inline bool
operator>=(base_uint<Bits, Tag> const& a, base_uint<Bits, Tag> const& b)
{
    return compare(a, b) >= 0;
}

template <std::size_t Bits, class Tag>
inline bool
operator==(base_uint<Bits, Tag> const& a, base_uint<Bits, Tag> const& b)
{
    return compare(a, b) == 0;
}

template <std::size_t Bits, class Tag>
inline bool
operator!=(base_uint<Bits, Tag> const& a, base_uint<Bits, Tag> const& b)
{
    return compare(a, b) != 0;
}

//------------------------------------------------------------------------------

template <std::size_t Bits, class Tag>
inline std::string
to_string(base_uint<Bits, Tag> const& a)
{
    return strHex(a.begin(), a.end());
}

template <std::size_t Bits, class Tag>
inline std::ostream&
operator<<(std::ostream& out, base_uint<Bits, Tag> const& u)
{
    return out << to_string(u);
}

template <std::size_t Bits, class Tag>
inline std::size_t
hash_value(base_uint<Bits, Tag> const& u)
{
    return boost::hash_range(u.begin(), u.end());
}

}  // namespace trustnet

namespace std {

template <std::size_t Bits, class Tag>
struct hash<trustnet::base_uint<Bits, Tag>>
{
    std::size_t
    operator()(trustnet::base_uint<Bits, Tag> const& u) const
    {
        return trustnet::hash_value(u);
    }
};

}  // namespace std

#endif
