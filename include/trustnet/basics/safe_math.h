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

#ifndef TRUSTNET_BASICS_SAFE_MATH_H_INCLUDED
#define TRUSTNET_BASICS_SAFE_MATH_H_INCLUDED

#include <concepts>
#include <limits>
#include <optional>

namespace trustnet {

/** Signed addition that reports overflow instead of wrapping. */
template <std::signed_integral Int>
constexpr std::optional<Int>
addChecked(Int a, Int b) noexcept
{
    if (b > 0 && a > std::numeric_limits<Int>::max() - b)
        return std::nullopt;
    if (b < 0 && a < std::numeric_limits<Int>::min() - b)
        return std::nullopt;
    return a + b;
}

/** Signed subtraction that reports overflow instead of wrapping. */
template <std::signed_integral Int>
constexpr std::optional<Int>
subChecked(Int a, Int b) noexcept
{
    if (b < 0 && a > std::numeric_limits<Int>::max() + b)
        return std::nullopt;
    if (b > 0 && a < std::numeric_limits<Int>::min() + b)
        return std::nullopt;
    return a - b;
}

}  // namespace trustnet

#endif
