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

#ifndef TRUSTNET_CORE_NETWORKCONFIG_H_INCLUDED
#define TRUSTNET_CORE_NETWORKCONFIG_H_INCLUDED

#include <trustnet/basics/BasicConfig.h>
#include <trustnet/beast/utility/Journal.h>
#include <trustnet/protocol/AccountID.h>
#include <trustnet/protocol/Protocol.h>
#include <trustnet/protocol/Rate.h>

#include <boost/filesystem.hpp>

#include <cstddef>
#include <optional>

namespace trustnet {

/** Governance settings, fixed when the network starts.

    A NetworkConfig is built once and then only read; every transaction
    sees the same values.
*/
struct NetworkConfig
{
    /** The only account allowed to freeze lines. */
    AccountID admin;

    /** The most intermediaries a ripple path may name. */
    std::size_t maxHops = maxRippleHops;

    /** The fraction of value each hop forwards, scaled by QUALITY_ONE. */
    Rate hopRate{defaultHopRate};

    beast::severities::Severity logSeverity = beast::severities::kWarning;

    std::optional<boost::filesystem::path> logFile;
};

/** Build the network configuration.

    Reads:

        [network]
        admin = <64 hex characters>

        [rippling]
        max_hops = 1..6
        hop_rate = 1..1000000

        [logging]
        severity = trace|debug|info|warning|error|fatal
        file = <path>

    @throws std::runtime_error if a value is missing or out of range.
*/
NetworkConfig
setup_NetworkConfig(BasicConfig const& config);

}  // namespace trustnet

#endif
