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


#include <trustnet/app/LedgerMaster.h>
#include <trustnet/rpc/ErrorCodes.h>
#include <trustnet/rpc/RPCHelpers.h>
#include <trustnet/rpc/handlers/Handlers.h>

namespace trustnet {

// {
//   account: <account>
//   peer: <account>
// }
Json::Value
doBalance(RPC::Context& context)
{
    AccountID account;
    if (auto const err =
            RPC::readAccountField(context.params, jss::account, account))
        return *err;

    AccountID peer;
    if (auto const err = RPC::readAccountField(context.params, jss::peer, peer))
        return *err;

    auto const line = context.ledgerMaster.getLine(account, peer);
    if (!line)
        return RPC::lineLookupError(line.error());

    auto const& sle = **line;

    Json::Value result(Json::objectValue);
    result[jss::account] = toBase16(account);
    result[jss::peer] = toBase16(peer);
    result[jss::asset] = sle.asset();
    result[jss::balance] = static_cast<Json::Int64>(sle.balanceFor(account));
    result[jss::limit] = static_cast<Json::Int64>(sle.limitFor(account));
    result[jss::limit_peer] = static_cast<Json::Int64>(sle.limitFor(peer));
    return result;
}

}  // namespace trustnet
