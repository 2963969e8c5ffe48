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

#ifndef TRUSTNET_PROTOCOL_INDEXES_H_INCLUDED
#define TRUSTNET_PROTOCOL_INDEXES_H_INCLUDED

#include <trustnet/basics/Expected.h>
#include <trustnet/protocol/AccountID.h>
#include <trustnet/protocol/Keylet.h>
#include <trustnet/protocol/TER.h>

namespace trustnet {

/** The two parties of a trust line in canonical order.

    `lo` compares strictly less than `hi`, whichever order the
    accounts were named in.
*/
struct LinePair
{
    AccountID lo;
    AccountID hi;

    /** Returns the party that is not `account`. */
    AccountID const&
    peer(AccountID const& account) const
    {
        return account == lo ? hi : lo;
    }

    bool
    contains(AccountID const& account) const
    {
        return account == lo || account == hi;
    }
};

inline bool
operator==(LinePair const& lhs, LinePair const& rhs)
{
    return lhs.lo == rhs.lo && lhs.hi == rhs.hi;
}

inline bool
operator!=(LinePair const& lhs, LinePair const& rhs)
{
    return !(lhs == rhs);
}

/** Order two participants into their canonical roles.

    canonicalize(p, q) == canonicalize(q, p) for every valid p != q.

    @return temDST_IS_SRC if the two participants are the same,
            temINVALID_ACCOUNT_ID if either is not a valid identity.
*/
Expected<LinePair, TER>
canonicalize(AccountID const& p, AccountID const& q);

/** Keylet computation funclets.

    Entries in the ledger are located using 256-bit locators. The locators
    are calculated using a wide range of parameters specific to the entry
    whose locator we are calculating (e.g. a trust line is derived from
    both accounts in canonical order).

    Rather than using the locator directly, we instead use a keylet which
    also carries the type of the entry being located.
*/
namespace keylet {

/** The index of a trust line between two accounts.

    The result is the same whichever order the accounts are given in.
*/
/** @{ */
Keylet
line(AccountID const& id0, AccountID const& id1) noexcept;

inline Keylet
line(LinePair const& pair) noexcept
{
    return line(pair.lo, pair.hi);
}
/** @} */

}  // namespace keylet

}  // namespace trustnet

#endif
