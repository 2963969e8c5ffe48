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

#ifndef TRUSTNET_PROTOCOL_PROTOCOL_H_INCLUDED
#define TRUSTNET_PROTOCOL_PROTOCOL_H_INCLUDED

#include <cstddef>
#include <cstdint>
#include <limits>

namespace trustnet {

/** Protocol specific constants.

    These values are fixed by the protocol. Changing them would change
    the outcome of transactions that were already applied.
*/
/** @{ */

/** The smallest number of intermediaries a ripple path may name. */
std::size_t constexpr minRippleHops = 1;

/** The largest number of intermediaries a ripple path may name. */
std::size_t constexpr maxRippleHops = 6;

/** The per-hop forwarding factor, scaled by QUALITY_ONE.

    Each hop keeps 0.1% of the value it forwards.
*/
std::uint32_t constexpr defaultHopRate = 999'000;

/** The largest magnitude a credit limit or amount may take. */
std::int64_t constexpr maxLineAmount = std::numeric_limits<std::int64_t>::max();

/** @} */

}  // namespace trustnet

#endif
