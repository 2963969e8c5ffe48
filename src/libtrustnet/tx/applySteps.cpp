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
#include <trustnet/basics/contract.h>
#include <trustnet/beast/utility/instrumentation.h>
#include <trustnet/tx/ApplyContext.h>
#include <trustnet/tx/Freeze.h>
#include <trustnet/tx/Payment.h>
#include <trustnet/tx/Ripple.h>
#include <trustnet/tx/SetLimits.h>
#include <trustnet/tx/SetQuality.h>
#include <trustnet/tx/SetRipple.h>
#include <trustnet/tx/Settle.h>
#include <trustnet/tx/TrustCreate.h>
#include <trustnet/tx/applySteps.h>

#include <stdexcept>

namespace trustnet {

namespace {

struct UnknownTxnType : std::exception
{
    TxType txnType;
    UnknownTxnType(TxType t) : txnType{t}
    {
    }

    char const*
    what() const noexcept override
    {
        return "unknown transaction type";
    }
};

// Call a lambda with the concrete transaction type as a template parameter
// throw an "UnknownTxnType" exception on error
template <class F>
auto
with_txn_type(TxType txnType, F&& f)
{
    switch (txnType)
    {
        case ttTRUST_CREATE:
            return f.template operator()<TrustCreate>();
        case ttPAYMENT:
            return f.template operator()<Payment>();
        case ttRIPPLE:
            return f.template operator()<Ripple>();
        case ttQUALITY_SET:
            return f.template operator()<SetQuality>();
        case ttRIPPLE_SET:
            return f.template operator()<SetRipple>();
        case ttLIMIT_SET:
            return f.template operator()<SetLimits>();
        case ttFREEZE:
            return f.template operator()<Freeze>();
        case ttSETTLE:
            return f.template operator()<Settle>();
    }
    Throw<UnknownTxnType>(txnType);
}

NotTEC
invoke_preflight(PreflightContext const& ctx)
{
    try
    {
        return with_txn_type(ctx.tx.getTxnType(), [&]<typename T>() {
            return T::preflight(ctx);
        });
    }
    catch (UnknownTxnType const& e)
    {
        // Should never happen
        JLOG(ctx.j.fatal())
            << "Unknown transaction type in preflight: " << e.txnType;
        UNREACHABLE("trustnet::invoke_preflight : unknown transaction type");
        return temUNKNOWN;
    }
}

TER
invoke_preclaim(PreclaimContext const& ctx)
{
    try
    {
        return with_txn_type(ctx.tx.getTxnType(), [&]<typename T>() -> TER {
            return T::preclaim(ctx);
        });
    }
    catch (UnknownTxnType const& e)
    {
        // Should never happen
        JLOG(ctx.j.fatal())
            << "Unknown transaction type in preclaim: " << e.txnType;
        UNREACHABLE("trustnet::invoke_preclaim : unknown transaction type");
        return temUNKNOWN;
    }
}

TER
invoke_apply(ApplyContext& ctx)
{
    try
    {
        return with_txn_type(ctx.tx.getTxnType(), [&]<typename T>() {
            T p(ctx);
            return p();
        });
    }
    catch (UnknownTxnType const& e)
    {
        // Should never happen
        JLOG(ctx.journal.fatal())
            << "Unknown transaction type in apply: " << e.txnType;
        UNREACHABLE("trustnet::invoke_apply : unknown transaction type");
        return temUNKNOWN;
    }
}

}  // namespace

PreflightResult
preflight(STTx const& tx, NetworkConfig const& config, beast::Journal j)
{
    PreflightContext const pfctx(tx, config, j);
    try
    {
        return {pfctx, invoke_preflight(pfctx)};
    }
    catch (std::exception const& e)
    {
        JLOG(j.fatal()) << "apply: " << e.what();
        return {pfctx, tefEXCEPTION};
    }
}

PreclaimResult
preclaim(PreflightResult const& preflightResult, ReadView const& view)
{
    PreclaimContext const ctx(
        view,
        preflightResult.ter,
        preflightResult.tx,
        preflightResult.config,
        preflightResult.j);

    if (!isTesSuccess(ctx.preflightResult))
        return {ctx, ctx.preflightResult};

    try
    {
        return {ctx, invoke_preclaim(ctx)};
    }
    catch (std::exception const& e)
    {
        JLOG(ctx.j.fatal()) << "apply: " << e.what();
        return {ctx, tefEXCEPTION};
    }
}

std::pair<TER, bool>
doApply(PreclaimResult const& preclaimResult, Sandbox& view)
{
    if (!preclaimResult.applicable)
        return {preclaimResult.ter, false};

    try
    {
        ApplyContext ctx(
            view, preclaimResult.tx, preclaimResult.config, preclaimResult.j);
        auto const ter = invoke_apply(ctx);
        if (!isTesSuccess(ter))
            ctx.discard();
        return {ter, isTesSuccess(ter)};
    }
    catch (std::exception const& e)
    {
        JLOG(preclaimResult.j.fatal()) << "apply: " << e.what();
        view.discard();
        return {tefEXCEPTION, false};
    }
}

}  // namespace trustnet
