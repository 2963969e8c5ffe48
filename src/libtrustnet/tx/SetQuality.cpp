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
#include <trustnet/protocol/Rate.h>
#include <trustnet/tx/SetQuality.h>

namespace trustnet {

NotTEC
SetQuality::preflight(PreflightContext const& ctx)
{
    if (auto const ret = preflight1(ctx); !isTesSuccess(ret))
        return ret;

    auto const& fields = ctx.tx.fields<QualitySetFields>();

    if (auto const ret = preflightCounterparty(ctx, fields.counterparty);
        !isTesSuccess(ret))
        return ret;

    if (!isValidQuality(fields.qualityIn) || !isValidQuality(fields.qualityOut))
    {
        JLOG(ctx.j.debug()) << "Malformed transaction: bad quality: "
                            << fields.qualityIn << ", " << fields.qualityOut;
        return temBAD_QUALITY;
    }

    return tesSUCCESS;
}

TER
SetQuality::doApply()
{
    auto const& fields = ctx_.tx.fields<QualitySetFields>();

    return setLineQuality(
        view(),
        account_,
        fields.counterparty,
        fields.qualityIn,
        fields.qualityOut,
        j_);
}

}  // namespace trustnet
