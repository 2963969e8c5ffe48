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

#ifndef TRUSTNET_PROTOCOL_RATE_H_INCLUDED
#define TRUSTNET_PROTOCOL_RATE_H_INCLUDED

#include <boost/operators.hpp>

#include <cstdint>
#include <optional>
#include <ostream>

namespace trustnet {

/** The value of a rate that neither grows nor shrinks an amount. */
std::uint32_t constexpr QUALITY_ONE = 1'000'000;

/** Represents a rate factor

    Rates are specified as fractions of 1 million. A line quality of
    1,000,000 is parity; the default per-hop forwarding rate of 999,000
    keeps 0.1% of every forwarded amount.
*/
struct Rate : private boost::totally_ordered<Rate>
{
    std::uint32_t value;

    Rate() = delete;

    explicit Rate(std::uint32_t rate) : value(rate)
    {
    }
};

inline bool
operator==(Rate const& lhs, Rate const& rhs) noexcept
{
    return lhs.value == rhs.value;
}

inline bool
operator<(Rate const& lhs, Rate const& rhs) noexcept
{
    return lhs.value < rhs.value;
}

inline std::ostream&
operator<<(std::ostream& os, Rate const& rate)
{
    os << rate.value;
    return os;
}

/** Returns `true` if the rate lies in (0, QUALITY_ONE]. */
inline bool
isValidQuality(std::uint32_t quality)
{
    return quality > 0 && quality <= QUALITY_ONE;
}

/** Scale a non-negative amount by a rate, rounding toward zero.

    @return std::nullopt if the amount is negative or the result does
            not fit in the amount type.
*/
std::optional<std::int64_t>
multiply(std::int64_t amount, Rate const& rate);

}  // namespace trustnet

#endif
