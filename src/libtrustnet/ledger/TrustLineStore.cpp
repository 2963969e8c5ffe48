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
#include <trustnet/ledger/TrustLineStore.h>

#include <stdexcept>

namespace trustnet {

bool
TrustLineStore::exists(Keylet const& k) const
{
    return lines_.find(k.key) != lines_.end();
}

std::shared_ptr<TrustLine const>
TrustLineStore::read(Keylet const& k) const
{
    auto const iter = lines_.find(k.key);
    if (iter == lines_.end())
        return nullptr;
    return iter->second;
}

std::vector<TrustLineStore::key_type>
TrustLineStore::linesOf(AccountID const& account) const
{
    auto const iter = byAccount_.find(account);
    if (iter == byAccount_.end())
        return {};
    return {iter->second.begin(), iter->second.end()};
}

void
TrustLineStore::rawInsert(std::shared_ptr<TrustLine const> const& line)
{
    auto const result = lines_.emplace(line->key(), line);
    if (!result.second)
        Throw<std::logic_error>(
            "TrustLineStore::rawInsert: key already exists");

    byAccount_[line->accountLo()].insert(line->key());
    byAccount_[line->accountHi()].insert(line->key());
    ++info_.lineCount;
}

void
TrustLineStore::rawReplace(std::shared_ptr<TrustLine const> const& line)
{
    auto const iter = lines_.find(line->key());
    if (iter == lines_.end())
        Throw<std::logic_error>("TrustLineStore::rawReplace: key not found");

    iter->second = line;
}

}  // namespace trustnet
