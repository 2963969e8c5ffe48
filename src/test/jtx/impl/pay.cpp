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


#include <test/jtx/pay.h>

namespace trustnet {
namespace test {
namespace jtx {

JTx
pay(Account const& account, Account const& to, std::int64_t amount)
{
    PaymentFields fields;
    fields.destination = to;
    fields.amount = amount;
    return JTx(account, fields);
}

JTx
ripple(
    Account const& account,
    std::vector<Account> const& hops,
    Account const& to,
    std::int64_t amount)
{
    RippleFields fields;
    for (auto const& hop : hops)
        fields.hops.push_back(hop.id());
    fields.destination = to;
    fields.amount = amount;
    return JTx(account, fields);
}

JTx
settle(
    Account const& debtor,
    Account const& creditor,
    std::int64_t amount,
    std::uint32_t asset)
{
    AssetTransfer transfer;
    transfer.asset = asset;
    transfer.payer = debtor;
    transfer.payee = creditor;
    transfer.amount = amount;
    return settle(debtor, creditor, amount, std::optional(transfer));
}

JTx
settle(
    Account const& debtor,
    Account const& creditor,
    std::int64_t amount,
    std::optional<AssetTransfer> transfer)
{
    SettleFields fields;
    fields.counterparty = creditor;
    fields.amount = amount;
    fields.transfer = std::move(transfer);
    return JTx(debtor, fields);
}

}  // namespace jtx
}  // namespace test
}  // namespace trustnet
