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
#include <trustnet/protocol/Protocol.h>
#include <trustnet/tx/Ripple.h>

#include <set>

namespace trustnet {

Expected<std::vector<std::int64_t>, TER>
Ripple::forwardedAmounts(
    std::int64_t amount,
    std::size_t hops,
    Rate const& rate)
{
    if (amount <= 0)
        return Unexpected(temBAD_AMOUNT);

    std::vector<std::int64_t> amounts;
    amounts.reserve(hops + 1);
    amounts.push_back(amount);

    for (std::size_t i = 0; i < hops; ++i)
    {
        auto const next = multiply(amounts.back(), rate);
        if (!next)
            return Unexpected(temOVERFLOW);
        if (*next <= 0)
            return Unexpected(temBAD_AMOUNT);
        amounts.push_back(*next);
    }

    return amounts;
}

std::vector<AccountID>
Ripple::participants(STTx const& tx)
{
    auto const& fields = tx.fields<RippleFields>();

    std::vector<AccountID> path;
    path.reserve(fields.hops.size() + 2);
    path.push_back(tx.getAccountID());
    path.insert(path.end(), fields.hops.begin(), fields.hops.end());
    path.push_back(fields.destination);
    return path;
}

NotTEC
Ripple::preflight(PreflightContext const& ctx)
{
    if (auto const ret = preflight1(ctx); !isTesSuccess(ret))
        return ret;

    auto const& fields = ctx.tx.fields<RippleFields>();

    if (fields.amount <= 0)
    {
        JLOG(ctx.j.debug()) << "Malformed transaction: bad amount: "
                            << fields.amount;
        return temBAD_AMOUNT;
    }

    if (fields.hops.size() < minRippleHops ||
        fields.hops.size() > ctx.config.maxHops)
    {
        JLOG(ctx.j.debug()) << "Malformed transaction: " << fields.hops.size()
                            << " intermediaries, allowed "
                            << minRippleHops << ".." << ctx.config.maxHops;
        return temBAD_PATH_COUNT;
    }

    if (!isValidAccount(fields.destination))
    {
        JLOG(ctx.j.debug()) << "Malformed transaction: "
                            << "Ripple destination account not specified.";
        return temINVALID_ACCOUNT_ID;
    }

    if (fields.destination == ctx.tx.getAccountID())
    {
        JLOG(ctx.j.debug()) << "Malformed transaction: "
                            << "Redundant ripple to self.";
        return temDST_IS_SRC;
    }

    std::set<AccountID> seen;
    for (auto const& account : participants(ctx.tx))
    {
        if (!isValidAccount(account))
        {
            JLOG(ctx.j.debug()) << "Malformed transaction: bad hop.";
            return temINVALID_ACCOUNT_ID;
        }

        // A path visits each participant once, so no line is used twice.
        if (!seen.insert(account).second)
        {
            JLOG(ctx.j.debug()) << "Malformed transaction: path revisits "
                                << toBase16(account);
            return temBAD_PATH_LOOP;
        }
    }

    auto const amounts = forwardedAmounts(
        fields.amount, fields.hops.size(), ctx.config.hopRate);
    if (!amounts)
    {
        JLOG(ctx.j.debug()) << "Malformed transaction: " << fields.amount
                            << " does not survive the path: "
                            << transToken(amounts.error());
        return amounts.error() == temOVERFLOW ? temOVERFLOW : temBAD_AMOUNT;
    }

    return tesSUCCESS;
}

TER
Ripple::preclaim(PreclaimContext const& ctx)
{
    auto const& fields = ctx.tx.fields<RippleFields>();
    auto const path = participants(ctx.tx);
    auto const amounts = forwardedAmounts(
        fields.amount, fields.hops.size(), ctx.config.hopRate);
    if (!amounts)
        return amounts.error();

    // Validate every line of the path against the committed ledger.
    // Nothing is changed here.
    for (std::size_t i = 0; i + 1 < path.size(); ++i)
    {
        auto const& sender = path[i];
        auto const& receiver = path[i + 1];
        auto const amount = (*amounts)[i];

        auto const line = getLine(ctx.view, sender, receiver);
        if (!line)
        {
            JLOG(ctx.j.debug()) << "Ripple: no line at hop " << i << ": "
                                << toBase16(sender) << " -> "
                                << toBase16(receiver);
            return line.error();
        }

        auto const balance = creditedBalance(**line, sender, amount);
        if (!balance)
        {
            JLOG(ctx.j.debug()) << "Ripple: hop " << i << " cannot carry "
                                << amount << ": "
                                << transToken(balance.error());
            return balance.error();
        }

        if (!(*line)->allowRippling())
        {
            JLOG(ctx.j.debug()) << "Ripple: hop " << i
                                << " does not allow rippling";
            return tecNO_RIPPLE;
        }
    }

    return tesSUCCESS;
}

TER
Ripple::doApply()
{
    auto const& fields = ctx_.tx.fields<RippleFields>();
    auto const path = participants(ctx_.tx);
    auto const amounts = forwardedAmounts(
        fields.amount, fields.hops.size(), ctx_.config.hopRate);
    if (!amounts)
        return amounts.error();

    for (std::size_t i = 0; i + 1 < path.size(); ++i)
    {
        // A failure here leaves the sandbox to be discarded, so no
        // line is changed.
        if (auto const ter =
                rippleCredit(view(), path[i], path[i + 1], (*amounts)[i], j_);
            !isTesSuccess(ter))
            return ter;
    }

    JLOG(j_.trace()) << "Ripple: " << path.size() - 1 << " lines moved, "
                     << fields.amount << " sent, " << amounts->back()
                     << " delivered";

    return tesSUCCESS;
}

}  // namespace trustnet
