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

#ifndef TRUSTNET_LEDGER_READVIEW_H_INCLUDED
#define TRUSTNET_LEDGER_READVIEW_H_INCLUDED

#include <trustnet/ledger/TrustLine.h>
#include <trustnet/protocol/AccountID.h>
#include <trustnet/protocol/Keylet.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace trustnet {

/** Information about the ledger as a whole. */
struct LedgerInfo
{
    /** Sequence of the last applied transaction. Zero before any. */
    std::uint32_t seq = 0;

    /** The number of trust lines ever created. */
    std::uint64_t lineCount = 0;
};

//------------------------------------------------------------------------------

/** A view into a ledger.

    This interface provides read access to state items.
*/
class ReadView
{
public:
    using key_type = uint256;

    virtual ~ReadView() = default;

    ReadView() = default;
    ReadView(ReadView const&) = default;
    ReadView&
    operator=(ReadView const&) = delete;

    /** Returns information about the ledger. */
    virtual LedgerInfo const&
    info() const = 0;

    /** Returns the sequence number of the ledger. */
    std::uint32_t
    seq() const
    {
        return info().seq;
    }

    /** Determine if a state item exists.

        @note This can be more efficient than calling read.

        @return `true` if a state item with the given key exists.
    */
    virtual bool
    exists(Keylet const& k) const = 0;

    /** Return the state item associated with a key.

        @return `nullptr` if the key is not present
    */
    virtual std::shared_ptr<TrustLine const>
    read(Keylet const& k) const = 0;

    /** Returns the keys of the lines `account` is a party to.

        The keys are returned in ascending order.
    */
    virtual std::vector<key_type>
    linesOf(AccountID const& account) const = 0;
};

}  // namespace trustnet

#endif
