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

#ifndef TRUSTNET_LEDGER_TRUSTLINE_H_INCLUDED
#define TRUSTNET_LEDGER_TRUSTLINE_H_INCLUDED

#include <trustnet/protocol/AccountID.h>
#include <trustnet/protocol/Indexes.h>
#include <trustnet/protocol/Keylet.h>
#include <trustnet/protocol/Rate.h>

#include <json/json.h>

#include <cstdint>
#include <memory>

namespace trustnet {

/** A bilateral credit line between two accounts.

    The line is stored once, under the canonical pair. A positive balance
    means the high account owes the low account; a negative balance means
    the low account owes the high account. The balance always lies within
    [-limitHi, limitLo].
*/
class TrustLine
{
public:
    using pointer = std::shared_ptr<TrustLine>;
    using const_pointer = std::shared_ptr<TrustLine const>;

    /** Create a new, empty line.

        The balance starts at zero and both qualities at parity.
    */
    TrustLine(
        LinePair const& pair,
        std::uint32_t asset,
        std::int64_t limitLo,
        std::int64_t limitHi,
        bool allowRippling);

    TrustLine(TrustLine const&) = default;
    TrustLine&
    operator=(TrustLine const&) = delete;

    uint256 const&
    key() const
    {
        return key_;
    }

    LinePair const&
    pair() const
    {
        return pair_;
    }

    AccountID const&
    accountLo() const
    {
        return pair_.lo;
    }

    AccountID const&
    accountHi() const
    {
        return pair_.hi;
    }

    std::uint32_t
    asset() const
    {
        return asset_;
    }

    std::int64_t
    limitLo() const
    {
        return limitLo_;
    }

    std::int64_t
    limitHi() const
    {
        return limitHi_;
    }

    std::int64_t
    balance() const
    {
        return balance_;
    }

    std::uint32_t
    qualityIn() const
    {
        return qualityIn_;
    }

    std::uint32_t
    qualityOut() const
    {
        return qualityOut_;
    }

    bool
    allowRippling() const
    {
        return allowRippling_;
    }

    bool
    frozen() const
    {
        return frozen_;
    }

    /** The ledger sequence of the transaction that created the line. */
    std::uint32_t
    createdSeq() const
    {
        return createdSeq_;
    }

    /** The position of this line in creation order, starting at 1. */
    std::uint64_t
    ordinal() const
    {
        return ordinal_;
    }

    /** The ledger sequence of the last transaction to modify the line. */
    std::uint32_t
    previousTxnSeq() const
    {
        return previousTxnSeq_;
    }

    /** Returns `true` if `account` is one of the two parties. */
    bool
    isParty(AccountID const& account) const
    {
        return pair_.contains(account);
    }

    /** The balance as seen by `account`.

        Positive means the peer owes `account`.
    */
    std::int64_t
    balanceFor(AccountID const& account) const
    {
        return account == pair_.lo ? balance_ : -balance_;
    }

    /** The most `account` may be owed on this line. */
    std::int64_t
    limitFor(AccountID const& account) const
    {
        return account == pair_.lo ? limitLo_ : limitHi_;
    }

    void
    setBalance(std::int64_t balance)
    {
        balance_ = balance;
    }

    void
    setLimits(std::int64_t limitLo, std::int64_t limitHi)
    {
        limitLo_ = limitLo;
        limitHi_ = limitHi;
    }

    void
    setQualities(std::uint32_t qualityIn, std::uint32_t qualityOut)
    {
        qualityIn_ = qualityIn;
        qualityOut_ = qualityOut;
    }

    void
    setAllowRippling(bool allow)
    {
        allowRippling_ = allow;
    }

    /** Pin both limits to zero and stop rippling. There is no way back. */
    void
    freeze();

    void
    setCreation(std::uint32_t seq, std::uint64_t ordinal)
    {
        createdSeq_ = seq;
        ordinal_ = ordinal;
        previousTxnSeq_ = seq;
    }

    void
    setPreviousTxnSeq(std::uint32_t seq)
    {
        previousTxnSeq_ = seq;
    }

    Json::Value
    getJson() const;

private:
    uint256 key_;
    LinePair pair_;
    std::uint32_t asset_;
    std::int64_t limitLo_;
    std::int64_t limitHi_;
    std::int64_t balance_ = 0;
    std::uint32_t qualityIn_ = QUALITY_ONE;
    std::uint32_t qualityOut_ = QUALITY_ONE;
    bool allowRippling_;
    bool frozen_ = false;
    std::uint32_t createdSeq_ = 0;
    std::uint64_t ordinal_ = 0;
    std::uint32_t previousTxnSeq_ = 0;
};

}  // namespace trustnet

#endif
