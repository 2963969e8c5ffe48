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

#ifndef TRUSTNET_TX_APPLYCONTEXT_H_INCLUDED
#define TRUSTNET_TX_APPLYCONTEXT_H_INCLUDED

#include <trustnet/beast/utility/Journal.h>
#include <trustnet/core/NetworkConfig.h>
#include <trustnet/ledger/ReadView.h>
#include <trustnet/ledger/Sandbox.h>
#include <trustnet/protocol/STTx.h>
#include <trustnet/protocol/TER.h>

namespace trustnet {

/** State information when preflighting a tx. */
struct PreflightContext
{
public:
    STTx const& tx;
    NetworkConfig const& config;
    beast::Journal const j;

    PreflightContext(
        STTx const& tx_,
        NetworkConfig const& config_,
        beast::Journal j_)
        : tx(tx_), config(config_), j(j_)
    {
    }

    PreflightContext&
    operator=(PreflightContext const&) = delete;
};

/** State information when determining if a tx is likely to claim. */
struct PreclaimContext
{
public:
    ReadView const& view;
    TER const preflightResult;
    STTx const& tx;
    NetworkConfig const& config;
    beast::Journal const j;

    PreclaimContext(
        ReadView const& view_,
        TER preflightResult_,
        STTx const& tx_,
        NetworkConfig const& config_,
        beast::Journal j_)
        : view(view_)
        , preflightResult(preflightResult_)
        , tx(tx_)
        , config(config_)
        , j(j_)
    {
    }

    PreclaimContext&
    operator=(PreclaimContext const&) = delete;
};

/** State information when applying a tx. */
class ApplyContext
{
public:
    ApplyContext(
        Sandbox& view,
        STTx const& tx,
        NetworkConfig const& config,
        beast::Journal journal);

    STTx const& tx;
    NetworkConfig const& config;
    beast::Journal const journal;

    ApplyView&
    view()
    {
        return view_;
    }

    ReadView const&
    view() const
    {
        return view_;
    }

    /** Discard changes and start fresh. */
    void
    discard()
    {
        view_.discard();
    }

private:
    Sandbox& view_;
};

}  // namespace trustnet

#endif
