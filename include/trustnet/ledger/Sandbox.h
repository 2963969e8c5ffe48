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

#ifndef TRUSTNET_LEDGER_SANDBOX_H_INCLUDED
#define TRUSTNET_LEDGER_SANDBOX_H_INCLUDED

#include <trustnet/ledger/ApplyView.h>
#include <trustnet/ledger/RawView.h>

#include <map>
#include <memory>
#include <utility>
#include <vector>

namespace trustnet {

/** Discardable, editable view to a ledger.

    The sandbox inherits the state of its parent view and records every
    insertion and modification privately. The parent is never touched
    until apply() is called, so the changes of a transaction become
    visible all at once or not at all.

    The sequence number reported by the sandbox is that of the
    transaction being applied: one past the parent's.
*/
class Sandbox : public ApplyView
{
public:
    explicit Sandbox(ReadView const& base);

    Sandbox(Sandbox const&) = delete;
    Sandbox&
    operator=(Sandbox const&) = delete;

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

    // ApplyView

    std::shared_ptr<TrustLine>
    peek(Keylet const& k) override;

    void
    insert(std::shared_ptr<TrustLine> const& line) override;

    void
    update(std::shared_ptr<TrustLine> const& line) override;

    /** Apply the recorded changes to the destination. */
    void
    apply(RawView& to) const;

    /** Forget every recorded change. */
    void
    discard();

    /** The keys of the lines inserted or modified, in key order. */
    std::vector<key_type>
    modified() const;

    /** Returns the number of recorded changes. */
    std::size_t
    size() const
    {
        return items_.size();
    }

private:
    enum class Action {
        insert,
        modify,
    };

    ReadView const& base_;
    LedgerInfo info_;
    std::map<key_type, std::pair<Action, std::shared_ptr<TrustLine>>> items_;
};

}  // namespace trustnet

#endif
