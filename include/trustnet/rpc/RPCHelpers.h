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


#ifndef TRUSTNET_RPC_RPCHELPERS_H_INCLUDED
#define TRUSTNET_RPC_RPCHELPERS_H_INCLUDED

#include <trustnet/protocol/AccountID.h>
#include <trustnet/protocol/TER.h>
#include <trustnet/rpc/Context.h>
#include <trustnet/rpc/Tuning.h>

#include <json/json.h>

#include <optional>

namespace trustnet {
namespace RPC {

/** Read a required account field from the request.

    @return An error object if the field is missing or malformed,
            otherwise the account.
*/
std::optional<Json::Value>
readAccountField(
    Json::Value const& params,
    Json::StaticString const& field,
    AccountID& result);

/** Read the optional `limit` field, clamped to `range`.

    @return An error object if the field is not an unsigned integer.
*/
std::optional<Json::Value>
readLimitField(
    unsigned int& limit,
    LimitRange const& range,
    Context const& context);

/** The error object for a failed trust line lookup. */
Json::Value
lineLookupError(TER ter);

}  // namespace RPC
}  // namespace trustnet

#endif
