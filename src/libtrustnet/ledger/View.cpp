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
#include <trustnet/basics/safe_math.h>
#include <trustnet/beast/utility/instrumentation.h>
#include <trustnet/ledger/View.h>
#include <trustnet/protocol/Protocol.h>
#include <trustnet/protocol/Rate.h>

#include <algorithm>

namespace trustnet {

namespace {

// Fetch a private copy of a line for modification.
Expected<std::shared_ptr<TrustLine>, TER>
peekLine(ApplyView& view, AccountID const& a, AccountID const& b)
{
    auto const pair = canonicalize(a, b);
    if (!pair)
        return Unexpected(pair.error());

    auto line = view.peek(keylet::line(*pair));
    if (!line)
        return Unexpected(tecNO_LINE);

    return line;
}

}  // namespace

Expected<std::shared_ptr<TrustLine const>, TER>
getLine(ReadView const& view, AccountID const& a, AccountID const& b)
{
    auto const pair = canonicalize(a, b);
    if (!pair)
        return Unexpected(pair.error());

    auto line = view.read(keylet::line(*pair));
    if (!line)
        return Unexpected(tecNO_LINE);

    return line;
}

Expected<std::int64_t, TER>
creditedBalance(
    TrustLine const& line,
    AccountID const& sender,
    std::int64_t amount)
{
    TRUSTNET_ASSERT(
        line.isParty(sender),
        "trustnet::creditedBalance : sender is a party");

    if (amount <= 0)
        return Unexpected(temBAD_AMOUNT);

    if (line.frozen())
        return Unexpected(tecFROZEN);

    // Value moving from the low account raises the balance.
    auto const balance = sender == line.accountLo()
        ? addChecked(line.balance(), amount)
        : subChecked(line.balance(), amount);
    if (!balance)
        return Unexpected(temOVERFLOW);

    if (*balance > line.limitLo() || *balance < -line.limitHi())
        return Unexpected(tecPATH_DRY);

    return *balance;
}

std::int64_t
availableCredit(TrustLine const& line, AccountID const& sender)
{
    if (line.frozen())
        return 0;

    auto const available = sender == line.accountLo()
        ? subChecked(line.limitLo(), line.balance())
        : addChecked(line.balance(), line.limitHi());

    if (!available)
        return maxLineAmount;

    return std::max<std::int64_t>(*available, 0);
}

TER
trustCreate(
    ApplyView& view,
    LinePair const& pair,
    std::uint32_t asset,
    std::int64_t limitLo,
    std::int64_t limitHi,
    bool allowRippling,
    beast::Journal j)
{
    TRUSTNET_ASSERT(
        limitLo > 0 && limitHi > 0,
        "trustnet::trustCreate : limits are positive");

    auto const k = keylet::line(pair);
    if (view.exists(k))
    {
        JLOG(j.debug()) << "trustCreate: line exists " << to_string(k.key);
        return tecDUPLICATE;
    }

    auto const line = std::make_shared<TrustLine>(
        pair, asset, limitLo, limitHi, allowRippling);
    line->setCreation(view.seq(), view.info().lineCount + 1);
    view.insert(line);

    JLOG(j.trace()) << "trustCreate: " << to_string(pair.lo) << ", "
                    << to_string(pair.hi) << " asset=" << asset
                    << " limitLo=" << limitLo << " limitHi=" << limitHi
                    << " ordinal=" << line->ordinal();

    return tesSUCCESS;
}

TER
rippleCredit(
    ApplyView& view,
    AccountID const& sender,
    AccountID const& receiver,
    std::int64_t amount,
    beast::Journal j)
{
    auto const line = peekLine(view, sender, receiver);
    if (!line)
        return line.error();

    auto const& sle = *line;
    auto const balance = creditedBalance(*sle, sender, amount);
    if (!balance)
    {
        JLOG(j.debug()) << "rippleCredit: " << to_string(sender) << " -> "
                        << to_string(receiver) << " : amount=" << amount
                        << " refused " << transToken(balance.error());
        return balance.error();
    }

    JLOG(j.trace()) << "rippleCredit: " << to_string(sender) << " -> "
                    << to_string(receiver) << " : before=" << sle->balance()
                    << " amount=" << amount << " after=" << *balance;

    sle->setBalance(*balance);
    sle->setPreviousTxnSeq(view.seq());
    view.update(sle);

    return tesSUCCESS;
}

TER
setLineQuality(
    ApplyView& view,
    AccountID const& a,
    AccountID const& b,
    std::uint32_t qualityIn,
    std::uint32_t qualityOut,
    beast::Journal j)
{
    TRUSTNET_ASSERT(
        isValidQuality(qualityIn) && isValidQuality(qualityOut),
        "trustnet::setLineQuality : qualities in range");

    auto const line = peekLine(view, a, b);
    if (!line)
        return line.error();

    auto const& sle = *line;
    if (sle->frozen())
        return tecFROZEN;

    JLOG(j.trace()) << "setLineQuality: " << to_string(sle->key())
                    << " in=" << qualityIn << " out=" << qualityOut;

    sle->setQualities(qualityIn, qualityOut);
    sle->setPreviousTxnSeq(view.seq());
    view.update(sle);

    return tesSUCCESS;
}

TER
setLineRippling(
    ApplyView& view,
    AccountID const& a,
    AccountID const& b,
    bool allowRippling,
    beast::Journal j)
{
    auto const line = peekLine(view, a, b);
    if (!line)
        return line.error();

    auto const& sle = *line;
    if (sle->frozen())
        return tecFROZEN;

    JLOG(j.trace()) << "setLineRippling: " << to_string(sle->key())
                    << " allow=" << allowRippling;

    sle->setAllowRippling(allowRippling);
    sle->setPreviousTxnSeq(view.seq());
    view.update(sle);

    return tesSUCCESS;
}

TER
setLineLimits(
    ApplyView& view,
    AccountID const& a,
    AccountID const& b,
    std::int64_t limitLo,
    std::int64_t limitHi,
    beast::Journal j)
{
    TRUSTNET_ASSERT(
        limitLo > 0 && limitHi > 0,
        "trustnet::setLineLimits : limits are positive");

    auto const line = peekLine(view, a, b);
    if (!line)
        return line.error();

    auto const& sle = *line;
    if (sle->frozen())
        return tecFROZEN;

    // Never shrink a limit below the exposure it currently covers.
    auto const balance = sle->balance();
    if ((balance >= 0 && limitLo < balance) ||
        (balance < 0 && limitHi < -balance))
    {
        JLOG(j.debug()) << "setLineLimits: " << to_string(sle->key())
                        << " balance=" << balance << " limitLo=" << limitLo
                        << " limitHi=" << limitHi;
        return tecLIMIT_EXPOSURE;
    }

    sle->setLimits(limitLo, limitHi);
    sle->setPreviousTxnSeq(view.seq());
    view.update(sle);

    return tesSUCCESS;
}

TER
freezeLine(
    ApplyView& view,
    AccountID const& a,
    AccountID const& b,
    beast::Journal j)
{
    auto const line = peekLine(view, a, b);
    if (!line)
        return line.error();

    auto const& sle = *line;

    JLOG(j.trace()) << "freezeLine: " << to_string(sle->key())
                    << " balance=" << sle->balance();

    sle->freeze();
    sle->setPreviousTxnSeq(view.seq());
    view.update(sle);

    return tesSUCCESS;
}

TER
settleDebt(
    ApplyView& view,
    AccountID const& debtor,
    AccountID const& creditor,
    std::int64_t amount,
    beast::Journal j)
{
    TRUSTNET_ASSERT(amount > 0, "trustnet::settleDebt : amount is positive");

    auto const line = peekLine(view, debtor, creditor);
    if (!line)
        return line.error();

    // A frozen line keeps its debt; settlement is the only way to retire it.
    auto const& sle = *line;
    auto const owed = sle->balanceFor(creditor);
    if (owed < amount)
    {
        JLOG(j.debug()) << "settleDebt: " << to_string(debtor) << " owes "
                        << owed << ", cannot settle " << amount;
        return tecEXCEEDS_DEBT;
    }

    // The balance moves toward zero by `amount` and cannot cross it.
    auto const balance = creditor == sle->accountLo()
        ? sle->balance() - amount
        : sle->balance() + amount;

    JLOG(j.trace()) << "settleDebt: " << to_string(sle->key())
                    << " before=" << sle->balance() << " after=" << balance;

    sle->setBalance(balance);
    sle->setPreviousTxnSeq(view.seq());
    view.update(sle);

    return tesSUCCESS;
}

}  // namespace trustnet
