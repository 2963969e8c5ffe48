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

#include <trustnet/basics/safe_cast.h>
#include <trustnet/protocol/Indexes.h>
#include <trustnet/protocol/digest.h>

#include <algorithm>
#include <cstdint>

namespace trustnet {

/** Type-specific prefix for calculating ledger indices.

    The identifier for a given object within the ledger is calculated based
    on some object-specific parameters. To ensure that different types of
    objects have different indices, even if they happen to use the same set
    of parameters, we use "tagged hashing" by adding a type-specific prefix.

    @note These values are part of the protocol and *CANNOT* be arbitrarily
          changed. If they were, on-ledger objects may no longer be able to
          be located or addressed.
*/
enum class LedgerNameSpace : std::uint16_t {
    TRUST_LINE = 'r',
};

template <class... Args>
static uint256
indexHash(LedgerNameSpace space, Args const&... args)
{
    return sha512Half(safe_cast<std::uint16_t>(space), args...);
}

Expected<LinePair, TER>
canonicalize(AccountID const& p, AccountID const& q)
{
    if (!isValidAccount(p) || !isValidAccount(q))
        return Unexpected(temINVALID_ACCOUNT_ID);

    if (p == q)
        return Unexpected(temDST_IS_SRC);

    auto const accounts = std::minmax(p, q);
    return LinePair{accounts.first, accounts.second};
}

namespace keylet {

Keylet
line(AccountID const& id0, AccountID const& id1) noexcept
{
    // A trust line is shared between two accounts and is fully
    // bidirectional. The accounts are hashed in canonical order
    // (smallest then largest) so either side finds the same entry.
    auto const accounts = std::minmax(id0, id1);

    return {
        ltTRUST_LINE,
        indexHash(
            LedgerNameSpace::TRUST_LINE, accounts.first, accounts.second)};
}

}  // namespace keylet

}  // namespace trustnet
