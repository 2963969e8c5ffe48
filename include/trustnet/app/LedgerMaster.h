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


#ifndef TRUSTNET_APP_LEDGERMASTER_H_INCLUDED
#define TRUSTNET_APP_LEDGERMASTER_H_INCLUDED

#include <trustnet/basics/Expected.h>
#include <trustnet/basics/Log.h>
#include <trustnet/core/NetworkConfig.h>
#include <trustnet/ledger/TrustLineStore.h>
#include <trustnet/protocol/STTx.h>
#include <trustnet/protocol/TER.h>
#include <trustnet/tx/apply.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace trustnet {

/** Owns the trust line store and applies transactions to it.

    Transactions are applied one at a time. Readers take the same lock,
    so a query never observes a transaction halfway through.

    The lines handed out are immutable snapshots; they stay valid after
    the lock is released.
*/
class LedgerMaster
{
public:
    using ScopedLockType = std::lock_guard<std::mutex>;

    /** Applies the [logging] settings in `config` to `logs`, and routes
        the debug journal to it until destruction.
    */
    LedgerMaster(NetworkConfig const& config, Logs& logs);

    ~LedgerMaster();

    LedgerMaster(LedgerMaster const&) = delete;
    LedgerMaster&
    operator=(LedgerMaster const&) = delete;

    NetworkConfig const&
    config() const
    {
        return config_;
    }

    /** Check and apply one transaction. */
    ApplyResult
    doTransaction(STTx const& tx);

    /** The sequence of the last applied transaction. */
    std::uint32_t
    getCurrentLedgerIndex() const;

    /** The number of lines ever created. */
    std::uint64_t
    getLineCount() const;

    /** The line between two accounts, in either order. */
    Expected<std::shared_ptr<TrustLine const>, TER>
    getLine(AccountID const& a, AccountID const& b) const;

    /** Every line `account` is a party to, ordered by key. */
    std::vector<std::shared_ptr<TrustLine const>>
    getAccountLines(AccountID const& account) const;

private:
    NetworkConfig const config_;
    Logs& logs_;
    beast::Journal const j_;
    std::unique_ptr<beast::Journal::Sink> previousDebugSink_;

    std::mutex mutable mutex_;
    TrustLineStore store_;
};

}  // namespace trustnet

#endif
