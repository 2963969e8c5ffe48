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

#ifndef TRUSTNET_LEDGER_VIEW_H_INCLUDED
#define TRUSTNET_LEDGER_VIEW_H_INCLUDED

#include <trustnet/basics/Expected.h>
#include <trustnet/beast/utility/Journal.h>
#include <trustnet/ledger/ApplyView.h>
#include <trustnet/ledger/ReadView.h>
#include <trustnet/protocol/Indexes.h>
#include <trustnet/protocol/TER.h>

#include <cstdint>
#include <memory>

namespace trustnet {

//------------------------------------------------------------------------------
//
// Observers
//
//------------------------------------------------------------------------------

/** Look up the line between two accounts, in either order.

    @return temDST_IS_SRC or temINVALID_ACCOUNT_ID if the accounts do not
            form a valid pair, tecNO_LINE if there is no line.
*/
Expected<std::shared_ptr<TrustLine const>, TER>
getLine(ReadView const& view, AccountID const& a, AccountID const& b);

/** Compute the balance that results from `sender` moving `amount` to
    its peer on `line`, without changing anything.

    This is the admissibility check shared by single payments and every
    hop of a ripple.

    @return tecFROZEN if the line is frozen, temOVERFLOW if the balance
            arithmetic overflows, tecPATH_DRY if the result would leave
            [-limitHi, limitLo].
*/
Expected<std::int64_t, TER>
creditedBalance(
    TrustLine const& line,
    AccountID const& sender,
    std::int64_t amount);

/** How much more `sender` may move to its peer on `line`.

    The result saturates at the largest representable amount.
*/
std::int64_t
availableCredit(TrustLine const& line, AccountID const& sender);

//------------------------------------------------------------------------------
//
// Modifiers
//
//------------------------------------------------------------------------------

/** Create a trust line.

    The balance starts at zero and both qualities at parity. The line
    records the sequence of the creating transaction and its position
    in creation order.

    Preconditions: `limitLo > 0` and `limitHi > 0`.

    @return tecDUPLICATE if the pair already has a line.
*/
[[nodiscard]] TER
trustCreate(
    ApplyView& view,
    LinePair const& pair,
    std::uint32_t asset,
    std::int64_t limitLo,
    std::int64_t limitHi,
    bool allowRippling,
    beast::Journal j);

/** Move `amount` from `sender` to `receiver` across their line. */
[[nodiscard]] TER
rippleCredit(
    ApplyView& view,
    AccountID const& sender,
    AccountID const& receiver,
    std::int64_t amount,
    beast::Journal j);

/** Record new qualities on a line.

    Preconditions: both qualities lie in (0, QUALITY_ONE].
*/
[[nodiscard]] TER
setLineQuality(
    ApplyView& view,
    AccountID const& a,
    AccountID const& b,
    std::uint32_t qualityIn,
    std::uint32_t qualityOut,
    beast::Journal j);

/** Allow or forbid rippling through a line. */
[[nodiscard]] TER
setLineRippling(
    ApplyView& view,
    AccountID const& a,
    AccountID const& b,
    bool allowRippling,
    beast::Journal j);

/** Replace both limits of a line.

    A limit may never drop below the debt it currently covers.

    Preconditions: `limitLo > 0` and `limitHi > 0`.

    @return tecLIMIT_EXPOSURE if a limit would not cover the balance.
*/
[[nodiscard]] TER
setLineLimits(
    ApplyView& view,
    AccountID const& a,
    AccountID const& b,
    std::int64_t limitLo,
    std::int64_t limitHi,
    beast::Journal j);

/** Freeze a line for good: limits pinned at zero, rippling disabled. */
[[nodiscard]] TER
freezeLine(
    ApplyView& view,
    AccountID const& a,
    AccountID const& b,
    beast::Journal j);

/** Reduce the debt `debtor` owes `creditor` by `amount`.

    Allowed on frozen lines: the balance only moves toward zero.

    @return tecEXCEEDS_DEBT if `debtor` owes less than `amount`.
*/
[[nodiscard]] TER
settleDebt(
    ApplyView& view,
    AccountID const& debtor,
    AccountID const& creditor,
    std::int64_t amount,
    beast::Journal j);

}  // namespace trustnet

#endif
