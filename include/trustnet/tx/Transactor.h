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

#ifndef TRUSTNET_TX_TRANSACTOR_H_INCLUDED
#define TRUSTNET_TX_TRANSACTOR_H_INCLUDED

#include <trustnet/beast/utility/Journal.h>
#include <trustnet/tx/ApplyContext.h>

namespace trustnet {

class Transactor
{
protected:
    ApplyContext& ctx_;
    beast::WrappedSink sink_;
    beast::Journal const j_;

    AccountID const account_;

public:
    virtual ~Transactor() = default;

    /** Process the transaction. */
    TER
    operator()();

    ApplyView&
    view()
    {
        return ctx_.view();
    }

    ApplyView const&
    view() const
    {
        return ctx_.view();
    }

    /////////////////////////////////////////////////////
    /*
    These static functions are called from invoke_preclaim<Tx>
    using name hiding to accomplish compile-time polymorphism,
    so derived classes can override for different or extra
    functionality. Use with care, as these are not really
    virtual and so don't have the compiler-time protection that
    comes with it.
    */

    static TER
    preclaim(PreclaimContext const& ctx)
    {
        // Most transactors have nothing to check
        // against the ledger before doApply.
        return tesSUCCESS;
    }
    /////////////////////////////////////////////////////

protected:
    explicit Transactor(ApplyContext& ctx);

    virtual TER
    doApply() = 0;

    Transactor(Transactor const&) = delete;
    Transactor&
    operator=(Transactor const&) = delete;
};

/** Performs early sanity checks on the submitting account. */
NotTEC
preflight1(PreflightContext const& ctx);

/** Checks that `counterparty` can form a line with the submitter. */
NotTEC
preflightCounterparty(
    PreflightContext const& ctx,
    AccountID const& counterparty);

}  // namespace trustnet

#endif
