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

#ifndef TRUSTNET_PROTOCOL_KEYLET_H_INCLUDED
#define TRUSTNET_PROTOCOL_KEYLET_H_INCLUDED

#include <trustnet/basics/base_uint.h>

#include <cstdint>
#include <type_traits>

namespace trustnet {

/** Identifiers for the kinds of entries held in the ledger state. */
enum LedgerEntryType : std::uint16_t {
    ltTRUST_LINE = 0x0072,
};

/** A pair of state key and LedgerEntryType.

    A Keylet identifies both a key in the state map and its ledger entry type.

    @note Keylet is a portmanteau of the words key and LET, an acronym for
          LedgerEntryType.
*/
struct Keylet
{
    LedgerEntryType type;
    uint256 key;

    Keylet(LedgerEntryType type_, uint256 const& key_) : type(type_), key(key_)
    {
    }
};

static_assert(!std::is_default_constructible_v<Keylet>);
static_assert(std::is_copy_constructible_v<Keylet>);

}  // namespace trustnet

#endif
