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


#include <trustnet/rpc/ErrorCodes.h>
#include <trustnet/rpc/RPCHelpers.h>

#include <algorithm>

namespace trustnet {
namespace RPC {

std::optional<Json::Value>
readAccountField(
    Json::Value const& params,
    Json::StaticString const& field,
    AccountID& result)
{
    if (!params.isMember(field))
        return missing_field_error(field);

    if (!params[field].isString())
        return expected_field_error(field, "string");

    auto const account = parseBase16(params[field].asString());
    if (!account)
        return make_error(rpcACT_MALFORMED);

    result = *account;
    return std::nullopt;
}

std::optional<Json::Value>
readLimitField(
    unsigned int& limit,
    LimitRange const& range,
    Context const& context)
{
    limit = range.rdefault;
    if (!context.params.isMember(jss::limit))
        return std::nullopt;

    auto const& jvLimit = context.params[jss::limit];
    if (!(jvLimit.isUInt() || (jvLimit.isInt() && jvLimit.asInt() >= 0)))
        return expected_field_error(jss::limit, "unsigned integer");

    limit = std::clamp(jvLimit.asUInt(), range.rmin, range.rmax);
    return std::nullopt;
}

Json::Value
lineLookupError(TER ter)
{
    if (ter == tecNO_LINE)
        return make_error(rpcLINE_NOT_FOUND);
    if (isTemMalformed(ter))
        return make_param_error(transHuman(ter));
    return make_error(rpcINTERNAL);
}

}  // namespace RPC
}  // namespace trustnet
