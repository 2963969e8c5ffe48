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
#include <trustnet/protocol/Indexes.h>
#include <trustnet/tx/TrustCreate.h>

namespace trustnet {

NotTEC
TrustCreate::preflight(PreflightContext const& ctx)
{
    if (auto const ret = preflight1(ctx); !isTesSuccess(ret))
        return ret;

    auto const& fields = ctx.tx.fields<TrustCreateFields>();

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

    return tesSUCCESS;
}

TER
TrustCreate::preclaim(PreclaimContext const& ctx)
{
    auto const& fields = ctx.tx.fields<TrustCreateFields>();

    if (ctx.view.exists(
            keylet::line(ctx.tx.getAccountID(), fields.counterparty)))
    {
        JLOG(ctx.j.debug()) << "TrustCreate: line already exists";
        return tecDUPLICATE;
    }

    return tesSUCCESS;
}

TER
TrustCreate::doApply()
{
    auto const& fields = ctx_.tx.fields<TrustCreateFields>();

    auto const pair = canonicalize(account_, fields.counterparty);
    if (!pair)
        return pair.error();

    return trustCreate(
        view(),
        *pair,
        fields.asset,
        fields.limitLo,
        fields.limitHi,
        fields.allowRippling,
        j_);
}

}  // namespace trustnet
