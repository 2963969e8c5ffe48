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

#include <trustnet/protocol/STTx.h>
#include <trustnet/protocol/jss.h>

#include <algorithm>
#include <type_traits>

namespace trustnet {

namespace {

Json::Value
amountJson(std::int64_t amount)
{
    return Json::Value(static_cast<Json::Int64>(amount));
}

struct FieldsToJson
{
    Json::Value& obj;

    void
    operator()(TrustCreateFields const& f) const
    {
        obj[jss::counterparty] = toBase16(f.counterparty);
        obj[jss::asset] = f.asset;
        obj[jss::limit_lo] = amountJson(f.limitLo);
        obj[jss::limit_hi] = amountJson(f.limitHi);
        obj[jss::allow_rippling] = f.allowRippling;
    }

    void
    operator()(PaymentFields const& f) const
    {
        obj[jss::destination] = toBase16(f.destination);
        obj[jss::amount] = amountJson(f.amount);
    }

    void
    operator()(RippleFields const& f) const
    {
        auto& hops = obj[jss::hops] = Json::arrayValue;
        for (auto const& hop : f.hops)
            hops.append(toBase16(hop));
        obj[jss::destination] = toBase16(f.destination);
        obj[jss::amount] = amountJson(f.amount);
    }

    void
    operator()(QualitySetFields const& f) const
    {
        obj[jss::counterparty] = toBase16(f.counterparty);
        obj[jss::quality_in] = f.qualityIn;
        obj[jss::quality_out] = f.qualityOut;
    }

    void
    operator()(RippleSetFields const& f) const
    {
        obj[jss::counterparty] = toBase16(f.counterparty);
        obj[jss::allow_rippling] = f.allowRippling;
    }

    void
    operator()(LimitSetFields const& f) const
    {
        obj[jss::counterparty] = toBase16(f.counterparty);
        obj[jss::limit_lo] = amountJson(f.limitLo);
        obj[jss::limit_hi] = amountJson(f.limitHi);
    }

    void
    operator()(FreezeFields const& f) const
    {
        obj[jss::first] = toBase16(f.first);
        obj[jss::second] = toBase16(f.second);
    }

    void
    operator()(SettleFields const& f) const
    {
        obj[jss::counterparty] = toBase16(f.counterparty);
        obj[jss::amount] = amountJson(f.amount);
        if (f.transfer)
        {
            auto& t = obj[jss::transfer] = Json::objectValue;
            t[jss::asset] = f.transfer->asset;
            t[jss::payer] = toBase16(f.transfer->payer);
            t[jss::payee] = toBase16(f.transfer->payee);
            t[jss::amount] = amountJson(f.transfer->amount);
        }
    }
};

}  // namespace

STTx::STTx(
    AccountID const& account,
    Body body,
    std::vector<AccountID> signers)
    : account_(account), body_(std::move(body)), signers_(std::move(signers))
{
}

TxType
STTx::getTxnType() const
{
    return std::visit(
        [](auto const& fields) {
            return std::decay_t<decltype(fields)>::txType;
        },
        body_);
}

bool
STTx::isSignedBy(AccountID const& id) const
{
    return id == account_ ||
        std::find(signers_.begin(), signers_.end(), id) != signers_.end();
}

Json::Value
STTx::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret[jss::TransactionType] = to_string(getTxnType());
    ret[jss::account] = toBase16(account_);
    if (!signers_.empty())
    {
        auto& signers = ret[jss::signers] = Json::arrayValue;
        for (auto const& signer : signers_)
            signers.append(toBase16(signer));
    }
    std::visit(FieldsToJson{ret}, body_);
    return ret;
}

}  // namespace trustnet
