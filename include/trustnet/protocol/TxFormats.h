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

#ifndef TRUSTNET_PROTOCOL_TXFORMATS_H_INCLUDED
#define TRUSTNET_PROTOCOL_TXFORMATS_H_INCLUDED

#include <cstdint>
#include <optional>
#include <string>

namespace trustnet {

/** Transaction type identifiers.

    These are part of the protocol.

    @note Changing these values will break existing records and audit
          trails. Only append new entries.
*/
// clang-format off
enum TxType : std::uint16_t
{
    /** This transaction type creates a trust line between two accounts. */
    ttTRUST_CREATE = 0,

    /** This transaction type moves value across a single trust line. */
    ttPAYMENT = 1,

    /** This transaction type moves value across a chain of trust lines. */
    ttRIPPLE = 2,

    /** This transaction type records the qualities of a trust line. */
    ttQUALITY_SET = 3,

    /** This transaction type allows or forbids rippling through a line. */
    ttRIPPLE_SET = 4,

    /** This transaction type changes both limits of a line. Both parties
        of the line must authorize it. */
    ttLIMIT_SET = 5,

    /** This transaction type permanently freezes a line. Only the
        network administrator may submit it. */
    ttFREEZE = 6,

    /** This transaction type records an external settlement of debt. */
    ttSETTLE = 7,
};
// clang-format on

/** Returns the name used for the transaction type in JSON. */
std::string
to_string(TxType type);

/** Look up a transaction type by its JSON name. */
std::optional<TxType>
txTypeFromString(std::string const& name);

}  // namespace trustnet

#endif
