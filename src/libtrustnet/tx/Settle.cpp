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
#include <trustnet/tx/Settle.h>

namespace trustnet {

NotTEC
Settle::preflight(PreflightContext const& ctx)
{
    if (auto const ret = preflight1(ctx); !isTesSuccess(ret))
        return ret;

    auto const& fields = ctx.tx.fields<SettleFields>();

    if (auto const ret = preflightCounterparty(ctx, fields.counterparty);
        !isTesSuccess(ret))
        return ret;

    if (fields.amount <= 0)
    {
        JLOG(ctx.j.debug()) << "Malformed transaction: bad amount: "
                            << fields.amount;
        return temBAD_AMOUNT;
    }

    auto const& transfer = fields.transfer;
    if (!transfer || transfer->payer != ctx.tx.getAccountID() ||
        transfer->payee != fields.counterparty ||
        transfer->amount != fields.amount)
    {
        JLOG(ctx.j.debug()) << "Malformed transaction: settlement is not "
                               "backed by a matching transfer";
        return temBAD_TRANSFER;
    }

    return tesSUCCESS;
}

TER
Settle::preclaim(PreclaimContext const& ctx)
{
    auto const& fields = ctx.tx.fields<SettleFields>();

    auto const line =
        getLine(ctx.view, ctx.tx.getAccountID(), fields.counterparty);
    if (!line)
        return line.error();

    // The transfer must move the asset the line is denominated in.
    if (fields.transfer->asset != (*line)->asset())
    {
        JLOG(ctx.j.debug()) << "Settle: transfer of asset "
                            << fields.transfer->asset << ", line holds "
                            << (*line)->asset();
        return temBAD_TRANSFER;
    }

    return tesSUCCESS;
}

TER
Settle::doApply()
{
    auto const& fields = ctx_.tx.fields<SettleFields>();

    return settleDebt(view(), account_, fields.counterparty, fields.amount, j_);
}

}  // namespace trustnet
