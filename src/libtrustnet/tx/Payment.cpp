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
#include <trustnet/tx/Payment.h>

namespace trustnet {

NotTEC
Payment::preflight(PreflightContext const& ctx)
{
    if (auto const ret = preflight1(ctx); !isTesSuccess(ret))
        return ret;

    auto const& fields = ctx.tx.fields<PaymentFields>();

    if (!isValidAccount(fields.destination))
    {
        JLOG(ctx.j.debug()) << "Malformed transaction: "
                            << "Payment destination account not specified.";
        return temINVALID_ACCOUNT_ID;
    }

    if (fields.destination == ctx.tx.getAccountID())
    {
        JLOG(ctx.j.debug()) << "Malformed transaction: "
                            << "Redundant payment from "
                            << toBase16(fields.destination) << " to self.";
        return temDST_IS_SRC;
    }

    if (fields.amount <= 0)
    {
        JLOG(ctx.j.debug()) << "Malformed transaction: bad amount: "
                            << fields.amount;
        return temBAD_AMOUNT;
    }

    return tesSUCCESS;
}

TER
Payment::preclaim(PreclaimContext const& ctx)
{
    auto const& fields = ctx.tx.fields<PaymentFields>();

    auto const line =
        getLine(ctx.view, ctx.tx.getAccountID(), fields.destination);
    if (!line)
        return line.error();

    auto const balance =
        creditedBalance(**line, ctx.tx.getAccountID(), fields.amount);
    if (!balance)
    {
        JLOG(ctx.j.debug()) << "Payment: " << fields.amount
                            << " does not fit the line: "
                            << transToken(balance.error());
        return balance.error();
    }

    return tesSUCCESS;
}

TER
Payment::doApply()
{
    auto const& fields = ctx_.tx.fields<PaymentFields>();

    return rippleCredit(
        view(), account_, fields.destination, fields.amount, j_);
}

}  // namespace trustnet
