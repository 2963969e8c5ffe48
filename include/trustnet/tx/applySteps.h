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

#ifndef TRUSTNET_TX_APPLYSTEPS_H_INCLUDED
#define TRUSTNET_TX_APPLYSTEPS_H_INCLUDED

#include <trustnet/beast/utility/Journal.h>
#include <trustnet/core/NetworkConfig.h>
#include <trustnet/ledger/ReadView.h>
#include <trustnet/ledger/Sandbox.h>
#include <trustnet/protocol/STTx.h>
#include <trustnet/protocol/TER.h>

#include <utility>

namespace trustnet {

/** Describes the results of the `preflight` check

    @note All members are const to make it more difficult
        to "fake" a result without calling `preflight`.
    @see preflight, preclaim, doApply, apply
*/
struct PreflightResult
{
public:
    /// From the input - the transaction
    STTx const& tx;
    /// From the input - the network configuration
    NetworkConfig const& config;
    /// From the input - the journal
    beast::Journal const j;

    /// Intermediate transaction result
    NotTEC const ter;

    /// Constructor
    template <class Context>
    PreflightResult(Context const& ctx_, NotTEC ter_)
        : tx(ctx_.tx), config(ctx_.config), j(ctx_.j), ter(ter_)
    {
    }

    PreflightResult(PreflightResult const&) = default;
    /// Deleted copy assignment operator
    PreflightResult&
    operator=(PreflightResult const&) = delete;
};

/** Describes the results of the `preclaim` check

    @note All members are const to make it more difficult
        to "fake" a result without calling `preclaim`.
    @see preflight, preclaim, doApply, apply
*/
struct PreclaimResult
{
public:
    /// From the input - the ledger view
    ReadView const& view;
    /// From the input - the transaction
    STTx const& tx;
    /// From the input - the network configuration
    NetworkConfig const& config;
    /// From the input - the journal
    beast::Journal const j;

    /// Intermediate transaction result
    TER const ter;

    /// Success flag - whether the transaction may be applied
    bool const applicable;

    /// Constructor
    template <class Context>
    PreclaimResult(Context const& ctx_, TER ter_)
        : view(ctx_.view)
        , tx(ctx_.tx)
        , config(ctx_.config)
        , j(ctx_.j)
        , ter(ter_)
        , applicable(isTesSuccess(ter_))
    {
    }

    PreclaimResult(PreclaimResult const&) = default;
    /// Deleted copy assignment operator
    PreclaimResult&
    operator=(PreclaimResult const&) = delete;
};

/** Gate a transaction based on static information.

    The transaction is checked against all possible
    validity constraints that do not require a ledger.

    @param tx The transaction to be checked.
    @param config The network configuration.
    @param j A journal.

    @see PreflightResult
*/
PreflightResult
preflight(STTx const& tx, NetworkConfig const& config, beast::Journal j);

/** Gate a transaction based on the committed ledger.

    The transaction is checked against every constraint that needs the
    ledger but not a change to it. Nothing is written.

    @param preflightResult The result of a previous
        call to `preflight` for the transaction.
    @param view The committed ledger.

    @see PreclaimResult
*/
PreclaimResult
preclaim(PreflightResult const& preflightResult, ReadView const& view);

/** Apply a prechecked transaction to a sandbox.

    @param preclaimResult The result of a previous
        call to `preclaim` for the transaction.
    @param view The sandbox the changes are recorded in. It must be
        layered over the view `preclaim` inspected.

    @return A pair with the `TER` and a `bool` indicating
        whether or not the changes may be applied.
*/
std::pair<TER, bool>
doApply(PreclaimResult const& preclaimResult, Sandbox& view);

}  // namespace trustnet

#endif
