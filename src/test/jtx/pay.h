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


#ifndef TRUSTNET_TEST_JTX_PAY_H_INCLUDED
#define TRUSTNET_TEST_JTX_PAY_H_INCLUDED

#include <test/jtx/Account.h>
#include <test/jtx/JTx.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace trustnet {
namespace test {
namespace jtx {

/** Send `amount` directly across the line between two accounts. */
JTx
pay(Account const& account, Account const& to, std::int64_t amount);

/** Send `amount` through each of `hops` in order, ending at `to`. */
JTx
ripple(
    Account const& account,
    std::vector<Account> const& hops,
    Account const& to,
    std::int64_t amount);

/** Repay debt, backed by a matching transfer of `asset`. */
JTx
settle(
    Account const& debtor,
    Account const& creditor,
    std::int64_t amount,
    std::uint32_t asset = 1);

/** Repay debt, backed by an explicit transfer. */
JTx
settle(
    Account const& debtor,
    Account const& creditor,
    std::int64_t amount,
    std::optional<AssetTransfer> transfer);

}  // namespace jtx
}  // namespace test
}  // namespace trustnet

#endif
