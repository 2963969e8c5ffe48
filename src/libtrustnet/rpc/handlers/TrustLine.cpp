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
//   first: <account>
//   second: <account>
// }
Json::Value
doTrustLine(RPC::Context& context)
{
    AccountID first;
    if (auto const err =
            RPC::readAccountField(context.params, jss::first, first))
        return *err;

    AccountID second;
    if (auto const err =
            RPC::readAccountField(context.params, jss::second, second))
        return *err;

    auto const line = context.ledgerMaster.getLine(first, second);
    if (!line)
        return RPC::lineLookupError(line.error());

    Json::Value result(Json::objectValue);
    result[jss::node] = (*line)->getJson();
    result[jss::ledger_seq] = context.ledgerMaster.getCurrentLedgerIndex();
    return result;
}

}  // namespace trustnet
