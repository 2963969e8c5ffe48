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
#include <trustnet/ledger/View.h>
#include <trustnet/tx/SetLimits.h>

namespace trustnet {

NotTEC
SetLimits::preflight(PreflightContext const& ctx)
{
    if (auto const ret = preflight1(ctx); !isTesSuccess(ret))
        return ret;

    auto const& tx = ctx.tx;
    auto const& fields = tx.fields<LimitSetFields>();

    if (auto const ret = preflightCounterparty(ctx, fields.counterparty);
        !isTesSuccess(ret))
        return ret;

    if (fields.limitLo <= 0 || fields.limitHi <= 0)
    {
        JLOG(ctx.j.debug()) << "Malformed transaction: Limits must be "
                               "positive: "
                            << fields.limitLo << ", " << fields.limitHi;
        return temBAD_LIMIT;
    }

    // Only the parties of the line may sign for it.
    for (auto const& signer : tx.getSigners())
    {
        if (signer != tx.getAccountID() && signer != fields.counterparty)
        {
            JLOG(ctx.j.debug()) << "Malformed transaction: "
                                << toBase16(signer)
                                << " is not a party of the line";
            return temBAD_SIGNER;
        }
    }

    // The submitter is one party; the other must co-sign.
    if (!tx.isSignedBy(fields.counterparty))
    {
        JLOG(ctx.j.debug()) << "SetLimits: missing co-signature of "
                            << toBase16(fields.counterparty);
        return tefBAD_QUORUM;
    }

    return tesSUCCESS;
}

TER
SetLimits::doApply()
{
    auto const& fields = ctx_.tx.fields<LimitSetFields>();

    return setLineLimits(
        view(),
        account_,
        fields.counterparty,
        fields.limitLo,
        fields.limitHi,
        j_);
}

}  // namespace trustnet
