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

#ifndef TRUSTNET_TX_RIPPLE_H_INCLUDED
#define TRUSTNET_TX_RIPPLE_H_INCLUDED

#include <trustnet/basics/Expected.h>
#include <trustnet/protocol/Rate.h>
#include <trustnet/tx/Transactor.h>

#include <cstdint>
#include <vector>

namespace trustnet {

/** Moves value through a chain of intermediaries.

    The path runs from the submitter through each hop, in order, to the
    destination. Line k of the path carries the amount forwarded after
    k hops; each hop keeps a fixed share of what passes through it.

    Every line is checked against the committed ledger before any line
    is changed. Either every line moves or none does.
*/
class Ripple : public Transactor
{
public:
    explicit Ripple(ApplyContext& ctx) : Transactor(ctx)
    {
    }

    static NotTEC
    preflight(PreflightContext const& ctx);

    static TER
    preclaim(PreclaimContext const& ctx);

    TER
    doApply() override;

    /** The amounts carried by each line of a path with `hops`
        intermediaries.

        The result holds `hops + 1` entries: `amount` first, and each
        later entry the previous one scaled by `rate`, rounded down.

        @return temOVERFLOW if the arithmetic overflows,
                temBAD_AMOUNT if an amount decays to zero.
    */
    static Expected<std::vector<std::int64_t>, TER>
    forwardedAmounts(std::int64_t amount, std::size_t hops, Rate const& rate);

    /** Every participant of the path, in order: the sender, the hops
        and the destination.
    */
    static std::vector<AccountID>
    participants(STTx const& tx);
};

}  // namespace trustnet

#endif
