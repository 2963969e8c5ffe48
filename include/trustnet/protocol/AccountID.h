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

#ifndef TRUSTNET_PROTOCOL_ACCOUNTID_H_INCLUDED
#define TRUSTNET_PROTOCOL_ACCOUNTID_H_INCLUDED

#include <trustnet/basics/Expected.h>
#include <trustnet/basics/base_uint.h>
#include <trustnet/protocol/TER.h>

#include <optional>
#include <string>
#include <string_view>

namespace trustnet {

namespace detail {

class AccountIDTag
{
public:
    explicit AccountIDTag() = default;
};

}  // namespace detail

/** A participant identity.

    Identities are 256-bit opaque values supplied by the host. They are
    written as 64 hexadecimal characters and ordered by byte-wise
    comparison.
*/
using AccountID = base_uint<256, detail::AccountIDTag>;

/** Convert AccountID to its hexadecimal representation. */
std::string
toBase16(AccountID const& v);

/** Parse an AccountID from 64 hexadecimal characters.

    The all-zero identity is reserved and is never a valid account.
*/
std::optional<AccountID>
parseBase16(std::string_view s);

/** Parse an AccountID, reporting temINVALID_ACCOUNT_ID on failure. */
Expected<AccountID, TER>
parseAccount(std::string_view s);

/** A placeholder for an empty or unset AccountID. */
AccountID const&
noAccount();

/** Returns `true` if the identity is well-formed. */
inline bool
isValidAccount(AccountID const& id)
{
    return id.isNonZero();
}

}  // namespace trustnet

#endif
