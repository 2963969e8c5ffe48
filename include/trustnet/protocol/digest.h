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

#ifndef TRUSTNET_PROTOCOL_DIGEST_H_INCLUDED
#define TRUSTNET_PROTOCOL_DIGEST_H_INCLUDED

#include <trustnet/basics/base_uint.h>

#include <array>
#include <cstdint>
#include <cstring>
#include <type_traits>

namespace trustnet {

/*  Message digest functions used to derive ledger keys

    Modeled to meet the requirements of `Hasher` in the
    `hash_append` interface, currently in proposal:

    N3980 "Types Don't Know #"
    http://www.open-std.org/jtc1/sc22/wg21/docs/papers/2014/n3980.html
*/

//------------------------------------------------------------------------------

/** SHA-512 digest

    @note This uses the OpenSSL implementation
*/
struct openssl_sha512_hasher
{
public:
    using result_type = std::array<std::uint8_t, 64>;

    openssl_sha512_hasher();

    void
    operator()(void const* data, std::size_t size) noexcept;

    explicit operator result_type() noexcept;

private:
    alignas(8) char ctx_[216];
};

//------------------------------------------------------------------------------

/** Returns the first 256 bits of SHA-512. */
struct sha512_half_hasher
{
private:
    openssl_sha512_hasher h_;

public:
    using result_type = uint256;

    void
    operator()(void const* data, std::size_t size) noexcept
    {
        h_(data, size);
    }

    explicit operator result_type() noexcept
    {
        auto const digest =
            static_cast<openssl_sha512_hasher::result_type>(h_);
        return result_type::fromVoid(digest.data());
    }
};

//------------------------------------------------------------------------------

/** Feed an integer to a hasher in big-endian byte order. */
template <class Hasher, class T>
std::enable_if_t<std::is_integral_v<T>>
hash_append(Hasher& h, T t) noexcept
{
    using U = std::make_unsigned_t<T>;
    auto u = static_cast<U>(t);
    std::array<std::uint8_t, sizeof(T)> buf;
    for (auto i = buf.size(); i-- > 0;)
    {
        buf[i] = static_cast<std::uint8_t>(u & 0xff);
        u = static_cast<U>(u >> 8);
    }
    h(buf.data(), buf.size());
}

/** Returns the SHA512-Half of a series of objects. */
template <class... Args>
sha512_half_hasher::result_type
sha512Half(Args const&... args)
{
    sha512_half_hasher h;
    (hash_append(h, args), ...);
    return static_cast<typename sha512_half_hasher::result_type>(h);
}

}  // namespace trustnet

#endif
