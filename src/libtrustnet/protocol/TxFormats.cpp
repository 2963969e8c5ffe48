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

#include <trustnet/protocol/TxFormats.h>

#include <array>
#include <utility>

namespace trustnet {

namespace {

// clang-format off
constexpr std::array<std::pair<TxType, char const*>, 8> txNames{{
    {ttTRUST_CREATE, "TrustCreate"},
    {ttPAYMENT,      "Payment"},
    {ttRIPPLE,       "Ripple"},
    {ttQUALITY_SET,  "QualitySet"},
    {ttRIPPLE_SET,   "RippleSet"},
    {ttLIMIT_SET,    "LimitSet"},
    {ttFREEZE,       "Freeze"},
    {ttSETTLE,       "Settle"},
}};
// clang-format on

}  // namespace

std::string
to_string(TxType type)
{
    for (auto const& [t, name] : txNames)
    {
        if (t == type)
            return name;
    }
    return "Unknown";
}

std::optional<TxType>
txTypeFromString(std::string const& name)
{
    for (auto const& [t, n] : txNames)
    {
        if (name == n)
            return t;
    }
    return std::nullopt;
}

}  // namespace trustnet
