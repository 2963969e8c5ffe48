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
#include <trustnet/basics/contract.h>
#include <trustnet/core/NetworkConfig.h>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace trustnet {

NetworkConfig
setup_NetworkConfig(BasicConfig const& config)
{
    NetworkConfig setup;

    {
        auto const& section = config.section("network");
        std::string admin;
        if (!set(admin, "admin", section))
            Throw<std::runtime_error>(
                "Missing administrator: [network] admin is required");

        auto const id = parseBase16(admin);
        if (!id)
            Throw<std::runtime_error>(
                "Invalid [network] admin: expected 64 hex characters");
        setup.admin = *id;
    }

    {
        auto const& section = config.section("rippling");
        // Parsed signed: an unsigned lexical_cast accepts "-1" and wraps it.
        try
        {
            if (auto const hops = section.get<std::int64_t>("max_hops"))
            {
                if (*hops < static_cast<std::int64_t>(minRippleHops) ||
                    *hops > static_cast<std::int64_t>(maxRippleHops))
                    Throw<std::runtime_error>(
                        "Invalid [rippling] max_hops: must be between " +
                        std::to_string(minRippleHops) + " and " +
                        std::to_string(maxRippleHops));
                setup.maxHops = static_cast<std::size_t>(*hops);
            }

            if (auto const rate = section.get<std::int64_t>("hop_rate"))
            {
                if (*rate < 1 || *rate > static_cast<std::int64_t>(QUALITY_ONE))
                    Throw<std::runtime_error>(
                        "Invalid [rippling] hop_rate: must be between 1 and " +
                        std::to_string(QUALITY_ONE));
                setup.hopRate = Rate(static_cast<std::uint32_t>(*rate));
            }
        }
        catch (boost::bad_lexical_cast const&)
        {
            Throw<std::runtime_error>(
                "Invalid [rippling] section: values must be integers");
        }
    }

    {
        auto const& section = config.section("logging");
        if (auto const severity = section.get("severity"))
        {
            auto const level = Logs::fromString(*severity);
            if (!level)
                Throw<std::runtime_error>(
                    "Invalid [logging] severity: " + *severity);
            setup.logSeverity = *level;
        }

        if (auto const file = section.get("file"))
            setup.logFile = boost::filesystem::path(*file);
    }

    return setup;
}

}  // namespace trustnet
