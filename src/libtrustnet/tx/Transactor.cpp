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
#include <trustnet/tx/Transactor.h>

namespace trustnet {

ApplyContext::ApplyContext(
    Sandbox& view,
    STTx const& tx_,
    NetworkConfig const& config_,
    beast::Journal journal_)
    : tx(tx_), config(config_), journal(journal_), view_(view)
{
}

//------------------------------------------------------------------------------

NotTEC
preflight1(PreflightContext const& ctx)
{
    if (!isValidAccount(ctx.tx.getAccountID()))
    {
        JLOG(ctx.j.debug()) << "preflight1: bad account";
        return temINVALID_ACCOUNT_ID;
    }

    for (auto const& signer : ctx.tx.getSigners())
    {
        if (!isValidAccount(signer))
        {
            JLOG(ctx.j.debug()) << "preflight1: bad signer";
            return temINVALID_ACCOUNT_ID;
        }
    }

    return tesSUCCESS;
}

NotTEC
preflightCounterparty(
    PreflightContext const& ctx,
    AccountID const& counterparty)
{
    if (!isValidAccount(counterparty))
    {
        JLOG(ctx.j.debug()) << "Malformed transaction: bad counterparty.";
        return temINVALID_ACCOUNT_ID;
    }

    if (counterparty == ctx.tx.getAccountID())
    {
        JLOG(ctx.j.debug())
            << "Malformed transaction: Can not form a line with self.";
        return temDST_IS_SRC;
    }

    return tesSUCCESS;
}

//------------------------------------------------------------------------------

Transactor::Transactor(ApplyContext& ctx)
    : ctx_(ctx)
    , sink_(ctx.journal, to_string(ctx.tx.getTxnType()) + " ")
    , j_(sink_)
    , account_(ctx.tx.getAccountID())
{
}

TER
Transactor::operator()()
{
    JLOG(j_.trace()) << "apply: " << toBase16(account_) << " seq "
                     << view().seq();

    TER const result = doApply();

    if (isTesSuccess(result))
    {
        JLOG(j_.trace()) << "applied: " << transToken(result);
    }
    else
    {
        JLOG(j_.debug()) << "refused: " << transToken(result) << " ("
                         << transHuman(result) << ")";
    }

    return result;
}

}  // namespace trustnet
