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

#ifndef TRUSTNET_LEDGER_TRUSTLINESTORE_H_INCLUDED
#define TRUSTNET_LEDGER_TRUSTLINESTORE_H_INCLUDED

#include <trustnet/ledger/RawView.h>
#include <trustnet/ledger/ReadView.h>

#include <map>
#include <memory>
#include <set>
#include <vector>

namespace trustnet {

/** The committed state: every trust line, addressed by its canonical key.

    Lines are immutable once stored; a change replaces the stored line.
    A reader holding a line never sees it change underneath it.

    Lines are never removed.
*/
class TrustLineStore : public ReadView, public RawView
{
public:
    TrustLineStore() = default;

    TrustLineStore(TrustLineStore const&) = delete;
    TrustLineStore&
    operator=(TrustLineStore const&) = delete;

    // ReadView

    LedgerInfo const&
    info() const override
    {
        return info_;
    }

    bool
    exists(Keylet const& k) const override;

    std::shared_ptr<TrustLine const>
    read(Keylet const& k) const override;

    std::vector<key_type>
    linesOf(AccountID const& account) const override;

    // RawView

    void
    rawInsert(std::shared_ptr<TrustLine const> const& line) override;

    void
    rawReplace(std::shared_ptr<TrustLine const> const& line) override;

    /** Close out one applied transaction. */
    void
    advance()
    {
        ++info_.seq;
    }

    /** The number of lines held. */
    std::size_t
    size() const
    {
        return lines_.size();
    }

private:
    LedgerInfo info_;
    std::map<key_type, std::shared_ptr<TrustLine const>> lines_;
    std::map<AccountID, std::set<key_type>> byAccount_;
};

}  // namespace trustnet

#endif
