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

#include <trustnet/basics/contract.h>
#include <trustnet/ledger/Sandbox.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace trustnet {

Sandbox::Sandbox(ReadView const& base) : base_(base), info_(base.info())
{
    ++info_.seq;
}

bool
Sandbox::exists(Keylet const& k) const
{
    if (items_.find(k.key) != items_.end())
        return true;
    return base_.exists(k);
}

std::shared_ptr<TrustLine const>
Sandbox::read(Keylet const& k) const
{
    auto const iter = items_.find(k.key);
    if (iter != items_.end())
        return iter->second.second;
    return base_.read(k);
}

std::vector<Sandbox::key_type>
Sandbox::linesOf(AccountID const& account) const
{
    auto keys = base_.linesOf(account);
    auto const mid = keys.size();
    for (auto const& [key, item] : items_)
    {
        if (item.first == Action::insert && item.second->isParty(account))
            keys.push_back(key);
    }
    std::inplace_merge(
        keys.begin(),
        keys.begin() + static_cast<std::ptrdiff_t>(mid),
        keys.end());
    return keys;
}

std::shared_ptr<TrustLine>
Sandbox::peek(Keylet const& k)
{
    auto const iter = items_.find(k.key);
    if (iter != items_.end())
        return std::make_shared<TrustLine>(*iter->second.second);

    auto const line = base_.read(k);
    if (!line)
        return nullptr;
    return std::make_shared<TrustLine>(*line);
}

void
Sandbox::insert(std::shared_ptr<TrustLine> const& line)
{
    Keylet const k(ltTRUST_LINE, line->key());
    if (exists(k))
        Throw<std::logic_error>("Sandbox::insert: key already exists");

    items_.emplace(line->key(), std::make_pair(Action::insert, line));
    ++info_.lineCount;
}

void
Sandbox::update(std::shared_ptr<TrustLine> const& line)
{
    auto const iter = items_.find(line->key());
    if (iter != items_.end())
    {
        // An inserted line stays an insertion.
        iter->second.second = line;
        return;
    }

    if (!base_.exists(Keylet(ltTRUST_LINE, line->key())))
        Throw<std::logic_error>("Sandbox::update: key not found");

    items_.emplace(line->key(), std::make_pair(Action::modify, line));
}

void
Sandbox::apply(RawView& to) const
{
    for (auto const& [key, item] : items_)
    {
        switch (item.first)
        {
            case Action::insert:
                to.rawInsert(item.second);
                break;
            case Action::modify:
                to.rawReplace(item.second);
                break;
        }
    }
}

void
Sandbox::discard()
{
    items_.clear();
    info_ = base_.info();
    ++info_.seq;
}

std::vector<Sandbox::key_type>
Sandbox::modified() const
{
    std::vector<key_type> keys;
    keys.reserve(items_.size());
    for (auto const& item : items_)
        keys.push_back(item.first);
    return keys;
}

}  // namespace trustnet
