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


#include <trustnet/app/LedgerMaster.h>
#include <trustnet/ledger/View.h>
#include <trustnet/protocol/Keylet.h>
#include <trustnet/protocol/TxFormats.h>

namespace trustnet {

LedgerMaster::LedgerMaster(NetworkConfig const& config, Logs& logs)
    : config_(config), logs_(logs), j_(logs.journal("LedgerMaster"))
{
    logs_.threshold(config_.logSeverity);

    if (config_.logFile && !logs_.open(*config_.logFile))
    {
        JLOG(j_.error()) << "Can't open log file " << *config_.logFile;
    }

    previousDebugSink_ =
        setDebugLogSink(logs_.makeSink("Debug", config_.logSeverity));
}

LedgerMaster::~LedgerMaster()
{
    setDebugLogSink(std::move(previousDebugSink_));
}

ApplyResult
LedgerMaster::doTransaction(STTx const& tx)
{
    auto const j = logs_.journal(to_string(tx.getTxnType()));

    ScopedLockType sl(mutex_);

    auto result = apply(store_, tx, config_, j);

    if (result.applied)
    {
        JLOG(j_.debug()) << "applied " << to_string(tx.getTxnType())
                         << " from " << tx.getAccountID() << " at seq "
                         << result.seq;
    }
    else
    {
        JLOG(j_.debug()) << "refused " << to_string(tx.getTxnType())
                         << " from " << tx.getAccountID() << ": "
                         << transToken(result.ter);
    }

    return result;
}

std::uint32_t
LedgerMaster::getCurrentLedgerIndex() const
{
    ScopedLockType sl(mutex_);
    return store_.seq();
}

std::uint64_t
LedgerMaster::getLineCount() const
{
    ScopedLockType sl(mutex_);
    return store_.info().lineCount;
}

Expected<std::shared_ptr<TrustLine const>, TER>
LedgerMaster::getLine(AccountID const& a, AccountID const& b) const
{
    ScopedLockType sl(mutex_);
    return trustnet::getLine(store_, a, b);
}

std::vector<std::shared_ptr<TrustLine const>>
LedgerMaster::getAccountLines(AccountID const& account) const
{
    std::vector<std::shared_ptr<TrustLine const>> lines;

    ScopedLockType sl(mutex_);
    for (auto const& key : store_.linesOf(account))
    {
        if (auto line = store_.read(Keylet(ltTRUST_LINE, key)))
            lines.push_back(std::move(line));
    }
    return lines;
}

}  // namespace trustnet
