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

#include <trustnet/ledger/TrustLine.h>
#include <trustnet/protocol/jss.h>

namespace trustnet {

TrustLine::TrustLine(
    LinePair const& pair,
    std::uint32_t asset,
    std::int64_t limitLo,
    std::int64_t limitHi,
    bool allowRippling)
    : key_(keylet::line(pair).key)
    , pair_(pair)
    , asset_(asset)
    , limitLo_(limitLo)
    , limitHi_(limitHi)
    , allowRippling_(allowRippling)
{
}

void
TrustLine::freeze()
{
    limitLo_ = 0;
    limitHi_ = 0;
    allowRippling_ = false;
    frozen_ = true;
}

Json::Value
TrustLine::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret[jss::index] = to_string(key_);
    ret[jss::account_lo] = toBase16(pair_.lo);
    ret[jss::account_hi] = toBase16(pair_.hi);
    ret[jss::asset] = asset_;
    ret[jss::balance] = static_cast<Json::Int64>(balance_);
    ret[jss::limit_lo] = static_cast<Json::Int64>(limitLo_);
    ret[jss::limit_hi] = static_cast<Json::Int64>(limitHi_);
    ret[jss::quality_in] = qualityIn_;
    ret[jss::quality_out] = qualityOut_;
    ret[jss::allow_rippling] = allowRippling_;
    ret[jss::frozen] = frozen_;
    ret[jss::created_seq] = createdSeq_;
    ret[jss::ordinal] = static_cast<Json::UInt64>(ordinal_);
    ret[jss::previous_txn_seq] = previousTxnSeq_;
    return ret;
}

}  // namespace trustnet
