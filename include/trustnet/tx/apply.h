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

#ifndef TRUSTNET_TX_APPLY_H_INCLUDED
#define TRUSTNET_TX_APPLY_H_INCLUDED

#include <trustnet/beast/utility/Journal.h>
#include <trustnet/core/NetworkConfig.h>
#include <trustnet/ledger/TrustLineStore.h>
#include <trustnet/protocol/STTx.h>
#include <trustnet/protocol/TER.h>

#include <json/json.h>

#include <cstdint>
#include <vector>

namespace trustnet {

/** The outcome of applying a transaction. */
struct ApplyResult
{
    TER ter;

    /** `true` if the changes were written to the store. */
    bool applied;

    /** The sequence of the transaction if applied, else the sequence of
        the store, which did not move.
    */
    std::uint32_t seq;

    /** Keys of the lines the transaction created or changed. */
    std::vector<uint256> affected;

    Json::Value
    getJson() const;
};

/** Apply a transaction to the store.

    The transaction is checked, then applied to a sandbox over the
    store. The sandbox is written back only on tesSUCCESS, so a failed
    transaction leaves the store untouched.

    The caller must serialize calls that share a store.
*/
ApplyResult
apply(
    TrustLineStore& store,
    STTx const& tx,
    NetworkConfig const& config,
    beast::Journal journal);

}  // namespace trustnet

#endif
