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

#include <algorithm>
#include <iterator>
#include <optional>

namespace trustnet {

namespace {

void
addLine(Json::Value& jsonLines, TrustLine const& line, AccountID const& account)
{
    auto const& peer = line.pair().peer(account);

    Json::Value& jPeer(jsonLines.append(Json::objectValue));
    jPeer[jss::index] = to_string(line.key());
    jPeer[jss::peer] = toBase16(peer);
    jPeer[jss::asset] = line.asset();
    // Positive if the peer owes the account, negative if the account
    // owes the peer.
    jPeer[jss::balance] = static_cast<Json::Int64>(line.balanceFor(account));
    jPeer[jss::limit] = static_cast<Json::Int64>(line.limitFor(account));
    jPeer[jss::limit_peer] = static_cast<Json::Int64>(line.limitFor(peer));
    jPeer[jss::quality_in] = line.qualityIn();
    jPeer[jss::quality_out] = line.qualityOut();
    jPeer[jss::allow_rippling] = line.allowRippling();
    if (line.frozen())
        jPeer[jss::frozen] = true;
}

}  // namespace

// {
//   account: <account>
//   limit: integer                 // optional
//   marker: <index of last line>   // optional, resume previous query
// }
Json::Value
doAccountLines(RPC::Context& context)
{
    auto const& params(context.params);

    AccountID account;
    if (auto const err = RPC::readAccountField(params, jss::account, account))
        return *err;

    unsigned int limit;
    if (auto const err =
            RPC::readLimitField(limit, RPC::Tuning::accountLines, context))
        return *err;

    std::optional<uint256> marker;
    if (params.isMember(jss::marker))
    {
        auto const& jvMarker = params[jss::marker];
        uint256 key;
        if (!jvMarker.isString() || !key.parseHex(jvMarker.asString()))
            return RPC::invalid_field_error(jss::marker);
        marker = key;
    }

    auto const lines = context.ledgerMaster.getAccountLines(account);

    auto iter = lines.begin();
    if (marker)
    {
        iter = std::find_if(lines.begin(), lines.end(), [&](auto const& l) {
            return l->key() == *marker;
        });
        if (iter == lines.end())
            return RPC::invalid_field_error(jss::marker);
        ++iter;
    }

    Json::Value result(Json::objectValue);
    result[jss::account] = toBase16(account);
    Json::Value& jsonLines(result[jss::lines] = Json::arrayValue);

    for (; iter != lines.end() && jsonLines.size() < limit; ++iter)
        addLine(jsonLines, **iter, account);

    if (iter != lines.end())
    {
        result[jss::limit] = limit;
        result[jss::marker] = to_string((*std::prev(iter))->key());
    }

    return result;
}

}  // namespace trustnet
