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


#include <trustnet/basics/Log.h>
#include <trustnet/rpc/ErrorCodes.h>
#include <trustnet/rpc/RPCHandler.h>
#include <trustnet/rpc/handlers/Handlers.h>

#include <exception>

namespace trustnet {
namespace RPC {

namespace {

using handler_type = Json::Value (*)(Context&);

struct Handler
{
    char const* name;
    handler_type valueMethod;
};

// clang-format off
Handler const handlerArray[]{
    {"account_lines", &doAccountLines},
    {"balance",       &doBalance},
    {"credit",        &doCredit},
    {"trust_line",    &doTrustLine},
};
// clang-format on

Handler const*
getHandler(std::string const& name)
{
    for (auto const& handler : handlerArray)
    {
        if (name == handler.name)
            return &handler;
    }
    return nullptr;
}

}  // namespace

Json::Value
doCommand(Context& context, std::string const& method)
{
    auto const handler = getHandler(method);
    if (!handler)
        return make_error(rpcUNKNOWN_COMMAND);

    if (!context.params.isObject())
        return make_param_error("Parameters must be an object.");

    try
    {
        JLOG(context.j.trace()) << "doCommand: " << method << " "
                                << context.params;
        return handler->valueMethod(context);
    }
    catch (std::exception const& ex)
    {
        JLOG(context.j.error())
            << "doCommand: " << method << " threw: " << ex.what();
        return make_error(rpcINTERNAL);
    }
}

}  // namespace RPC
}  // namespace trustnet
