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
#include <trustnet/tx/Freeze.h>

namespace trustnet {

NotTEC
Freeze::preflight(PreflightContext const& ctx)
{
    if (auto const ret = preflight1(ctx); !isTesSuccess(ret))
        return ret;

    auto const& fields = ctx.tx.fields<FreezeFields>();

    if (!isValidAccount(fields.first) || !isValidAccount(fields.second))
    {
        JLOG(ctx.j.debug()) << "Malformed transaction: bad account.";
        return temINVALID_ACCOUNT_ID;
    }

    if (fields.first == fields.second)
    {
        JLOG(ctx.j.debug()) << "Malformed transaction: no line with self.";
        return temDST_IS_SRC;
    }

    return tesSUCCESS;
}

TER
Freeze::preclaim(PreclaimContext const& ctx)
{
    if (ctx.tx.getAccountID() != ctx.config.admin)
    {
        JLOG(ctx.j.debug()) << "Freeze: " << toBase16(ctx.tx.getAccountID())
                            << " is not the administrator";
        return tecNO_PERMISSION;
    }

    auto const& fields = ctx.tx.fields<FreezeFields>();
    if (auto const line = getLine(ctx.view, fields.first, fields.second);
        !line)
        return line.error();

    return tesSUCCESS;
}

TER
Freeze::doApply()
{
    auto const& fields = ctx_.tx.fields<FreezeFields>();

    auto const ter = freezeLine(view(), fields.first, fields.second, j_);
    if (isTesSuccess(ter))
    {
        JLOG(j_.info()) << "Froze line " << toBase16(fields.first) << ", "
                        << toBase16(fields.second);
    }

    return ter;
}

}  // namespace trustnet
