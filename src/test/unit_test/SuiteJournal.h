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


#ifndef TRUSTNET_TEST_UNIT_TEST_SUITE_JOURNAL_H_INCLUDED
#define TRUSTNET_TEST_UNIT_TEST_SUITE_JOURNAL_H_INCLUDED

#include <trustnet/basics/Log.h>
#include <trustnet/beast/utility/Journal.h>

#include <boost/beast/_experimental/unit_test/suite.hpp>

#include <memory>
#include <string>

namespace trustnet {
namespace test {

// A Journal::Sink intended for use with the beast unit test framework.
class SuiteJournalSink : public beast::Journal::Sink
{
    std::string partition_;
    boost::beast::unit_test::suite& suite_;

public:
    SuiteJournalSink(
        std::string const& partition,
        beast::severities::Severity threshold,
        boost::beast::unit_test::suite& suite)
        : Sink(threshold, false), partition_(partition + " "), suite_(suite)
    {
    }

    bool
    active(beast::severities::Severity level) const override
    {
        return level >= threshold();
    }

    void
    write(beast::severities::Severity level, std::string const& text)
        override
    {
        if (level < threshold())
            return;

        using namespace beast::severities;
        char const* s = "FTL:";
        switch (level)
        {
            case kTrace:
                s = "TRC:";
                break;
            case kDebug:
                s = "DBG:";
                break;
            case kInfo:
                s = "INF:";
                break;
            case kWarning:
                s = "WRN:";
                break;
            case kError:
                s = "ERR:";
                break;
            default:
                break;
        }

        suite_.log << s << partition_ << text << std::endl;
    }
};

/** Logs that write every partition to the running suite's log. */
class SuiteLogs : public Logs
{
    boost::beast::unit_test::suite& suite_;

public:
    explicit SuiteLogs(
        boost::beast::unit_test::suite& suite,
        beast::severities::Severity threshold = beast::severities::kError)
        : Logs(threshold), suite_(suite)
    {
    }

    ~SuiteLogs() override = default;

    std::unique_ptr<beast::Journal::Sink>
    makeSink(
        std::string const& partition,
        beast::severities::Severity threshold) override
    {
        return std::make_unique<SuiteJournalSink>(partition, threshold, suite_);
    }
};

}  // namespace test
}  // namespace trustnet

#endif
