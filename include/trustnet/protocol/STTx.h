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

#ifndef TRUSTNET_PROTOCOL_STTX_H_INCLUDED
#define TRUSTNET_PROTOCOL_STTX_H_INCLUDED

#include <trustnet/protocol/AccountID.h>
#include <trustnet/protocol/TxFormats.h>

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace trustnet {

/** Fields of a request to open a trust line with a counterparty.

    The limits are given by canonical role: `limitLo` bounds what the
    lower account may be owed, `limitHi` what the higher account may be
    owed.
*/
struct TrustCreateFields
{
    static constexpr TxType txType = ttTRUST_CREATE;

    AccountID counterparty;
    std::uint32_t asset = 0;
    std::int64_t limitLo = 0;
    std::int64_t limitHi = 0;
    bool allowRippling = false;
};

struct PaymentFields
{
    static constexpr TxType txType = ttPAYMENT;

    AccountID destination;
    std::int64_t amount = 0;
};

/** Fields of a multi-hop payment.

    Value flows from the submitting account through each of `hops` in
    order and ends at `destination`.
*/
struct RippleFields
{
    static constexpr TxType txType = ttRIPPLE;

    std::vector<AccountID> hops;
    AccountID destination;
    std::int64_t amount = 0;
};

struct QualitySetFields
{
    static constexpr TxType txType = ttQUALITY_SET;

    AccountID counterparty;
    std::uint32_t qualityIn = 0;
    std::uint32_t qualityOut = 0;
};

struct RippleSetFields
{
    static constexpr TxType txType = ttRIPPLE_SET;

    AccountID counterparty;
    bool allowRippling = false;
};

/** New limits for a line, by canonical role. */
struct LimitSetFields
{
    static constexpr TxType txType = ttLIMIT_SET;

    AccountID counterparty;
    std::int64_t limitLo = 0;
    std::int64_t limitHi = 0;
};

/** The line between `first` and `second` is frozen. */
struct FreezeFields
{
    static constexpr TxType txType = ttFREEZE;

    AccountID first;
    AccountID second;
};

/** Evidence of a movement of the underlying asset, made outside of the
    trust line ledger.
*/
struct AssetTransfer
{
    std::uint32_t asset = 0;
    AccountID payer;
    AccountID payee;
    std::int64_t amount = 0;
};

/** The submitting account repays `amount` of its debt to `counterparty`. */
struct SettleFields
{
    static constexpr TxType txType = ttSETTLE;

    AccountID counterparty;
    std::int64_t amount = 0;
    std::optional<AssetTransfer> transfer;
};

//------------------------------------------------------------------------------

/** A transaction submitted by an account.

    The host supplies the identity of the submitting account and of any
    co-signers; this class does not verify signatures.
*/
class STTx
{
public:
    using Body = std::variant<
        TrustCreateFields,
        PaymentFields,
        RippleFields,
        QualitySetFields,
        RippleSetFields,
        LimitSetFields,
        FreezeFields,
        SettleFields>;

    STTx(
        AccountID const& account,
        Body body,
        std::vector<AccountID> signers = {});

    STTx(STTx const&) = default;
    STTx&
    operator=(STTx const&) = default;

    TxType
    getTxnType() const;

    AccountID const&
    getAccountID() const
    {
        return account_;
    }

    std::vector<AccountID> const&
    getSigners() const
    {
        return signers_;
    }

    /** Returns `true` if `id` submitted or co-signed the transaction. */
    bool
    isSignedBy(AccountID const& id) const;

    Body const&
    body() const
    {
        return body_;
    }

    /** Access the typed fields.

        @throws std::bad_variant_access if the transaction is of
                another type.
    */
    template <class Fields>
    Fields const&
    fields() const
    {
        return std::get<Fields>(body_);
    }

    Json::Value
    getJson() const;

private:
    AccountID account_;
    Body body_;
    std::vector<AccountID> signers_;
};

}  // namespace trustnet

#endif
