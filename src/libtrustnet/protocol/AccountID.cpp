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

#include <trustnet/protocol/AccountID.h>

namespace trustnet {

std::string
toBase16(AccountID const& v)
{
    return to_string(v);
}

std::optional<AccountID>
parseBase16(std::string_view s)
{
    AccountID id;
    if (!id.parseHex(s) || !isValidAccount(id))
        return std::nullopt;
    return id;
}

Expected<AccountID, TER>
parseAccount(std::string_view s)
{
    if (auto const id = parseBase16(s))
        return *id;
    return Unexpected(temINVALID_ACCOUNT_ID);
}

AccountID const&
noAccount()
{
    static AccountID const account{};
    return account;
}

}  // namespace trustnet
