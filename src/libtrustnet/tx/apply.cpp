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

#include <trustnet/basics/Log.h>
#include <trustnet/ledger/Sandbox.h>
#include <trustnet/protocol/jss.h>
#include <trustnet/tx/apply.h>
#include <trustnet/tx/applySteps.h>

namespace trustnet {

Json::Value
ApplyResult::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret[jss::engine_result] = transToken(ter);
    ret[jss::engine_result_code] = ter;
    ret[jss::engine_result_message] = transHuman(ter);
    ret[jss::applied] = applied;
    ret[jss::ledger_seq] = seq;
    auto& affectedKeys = ret[jss::affected] = Json::arrayValue;
    for (auto const& key : affected)
        affectedKeys.append(to_string(key));
    return ret;
}

ApplyResult
apply(
    TrustLineStore& store,
    STTx const& tx,
    NetworkConfig const& config,
    beast::Journal j)
{
    auto const pfresult = preflight(tx, config, j);
    auto const pcresult = preclaim(pfresult, store);

    Sandbox sb(store);
    auto const [ter, applicable] = doApply(pcresult, sb);

    if (!applicable)
        return {ter, false, store.seq(), {}};

    auto affected = sb.modified();
    sb.apply(store);
    store.advance();

    JLOG(j.trace()) << "apply: " << to_string(tx.getTxnType()) << " seq "
                    << store.seq() << " changed " << affected.size()
                    << " lines";

    return {ter, true, store.seq(), std::move(affected)};
}

}  // namespace trustnet
