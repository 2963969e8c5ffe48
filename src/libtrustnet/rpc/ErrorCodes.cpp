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


#include <trustnet/beast/utility/instrumentation.h>
#include <trustnet/rpc/ErrorCodes.h>

#include <algorithm>
#include <iterator>

namespace trustnet {
namespace RPC {

namespace detail {

// clang-format off
constexpr static ErrorInfo errorInfos[]{
    {rpcACT_MALFORMED,   "actMalformed",  "Account malformed."},
    {rpcACT_NOT_FOUND,   "actNotFound",   "Account not found."},
    {rpcBAD_SYNTAX,      "badSyntax",     "Syntax error."},
    {rpcINTERNAL,        "internal",      "Internal error."},
    {rpcINVALID_PARAMS,  "invalidParams", "Invalid parameters."},
    {rpcLINE_NOT_FOUND,  "lineNotFound",  "Trust line not found."},
    {rpcUNKNOWN_COMMAND, "unknownCmd",    "Unknown method."},
};
// clang-format on

constexpr ErrorInfo unknownError;

}  // namespace detail

//------------------------------------------------------------------------------

ErrorInfo const&
get_error_info(error_code_i code)
{
    auto const iter = std::find_if(
        std::begin(detail::errorInfos),
        std::end(detail::errorInfos),
        [code](ErrorInfo const& info) { return info.code == code; });
    if (iter == std::end(detail::errorInfos))
        return detail::unknownError;
    return *iter;
}

Json::Value
make_error(error_code_i code)
{
    Json::Value json;
    inject_error(code, json);
    return json;
}

Json::Value
make_error(error_code_i code, std::string const& message)
{
    Json::Value json;
    inject_error(code, message, json);
    return json;
}

bool
contains_error(Json::Value const& json)
{
    if (json.isObject() && json.isMember(jss::error))
        return true;
    return false;
}

}  // namespace RPC

std::string
rpcErrorString(Json::Value const& jv)
{
    TRUSTNET_ASSERT(
        RPC::contains_error(jv),
        "trustnet::rpcErrorString : input contains an error");
    return jv[jss::error].asString() + jv[jss::error_message].asString();
}

}  // namespace trustnet
