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

#ifndef TRUSTNET_BASICS_LOG_H_INCLUDED
#define TRUSTNET_BASICS_LOG_H_INCLUDED

#include <trustnet/beast/utility/Journal.h>

#include <boost/beast/core/string.hpp>
#include <boost/filesystem.hpp>

#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace trustnet {

/** Manages partitions for logging. */
class Logs
{
private:
    class Sink : public beast::Journal::Sink
    {
    private:
        Logs& logs_;
        std::string partition_;

    public:
        Sink(
            std::string const& partition,
            beast::severities::Severity thresh,
            Logs& logs);

        Sink(Sink const&) = delete;
        Sink&
        operator=(Sink const&) = delete;

        void
        write(beast::severities::Severity level, std::string const& text)
            override;
    };

    /** Manages a system file containing logged output.
        The system file remains open during program execution.
        @note None of the listed interfaces are thread-safe.
    */
    class File
    {
    public:
        File() = default;

        /** Associate a system file with the log.
            The file is created if it does not exist, otherwise it is
            opened for appending. Any previous file is closed first.
            @return `true` if the file was opened.
        */
        bool
        open(boost::filesystem::path const& path);

        /** Close the system file if it is open. */
        void
        close();

        /** Write to the log file and append an end of line marker.
            Does nothing if there is no associated system file.
        */
        void
        writeln(std::string const& text);

    private:
        std::unique_ptr<std::ofstream> m_stream;
        boost::filesystem::path m_path;
    };

    std::mutex mutable mutex_;
    std::map<
        std::string,
        std::unique_ptr<beast::Journal::Sink>,
        boost::beast::iless>
        sinks_;
    beast::severities::Severity thresh_;
    File file_;

public:
    explicit Logs(beast::severities::Severity level);

    Logs(Logs const&) = delete;
    Logs&
    operator=(Logs const&) = delete;

    virtual ~Logs() = default;

    bool
    open(boost::filesystem::path const& pathToLogFile);

    beast::Journal::Sink&
    get(std::string const& name);

    beast::Journal
    journal(std::string const& name);

    beast::severities::Severity
    threshold() const;

    void
    threshold(beast::severities::Severity thresh);

    /** Write to the log file, if open, and to stderr. */
    void
    write(
        beast::severities::Severity level,
        std::string const& partition,
        std::string const& text);

    virtual std::unique_ptr<beast::Journal::Sink>
    makeSink(
        std::string const& partition,
        beast::severities::Severity startingLevel);

public:
    /** Parse a severity name, case-insensitively.
        Accepts "trace", "debug", "info", "warning" (or "warn"),
        "error" and "fatal".
    */
    static std::optional<beast::severities::Severity>
    fromString(std::string const& s);

private:
    enum {
        // Maximum line length for log messages.
        // If the message exceeds this length it will be truncated with elipses.
        maximumMessageCharacters = 12 * 1024
    };

    static void
    format(
        std::string& output,
        std::string const& message,
        beast::severities::Severity severity,
        std::string const& partition);
};

// Wraps a Journal::Stream to skip evaluation of
// expensive argument lists if the stream is not active.
#ifndef JLOG
#define JLOG(x) \
    if (!x)     \
    {           \
    }           \
    else        \
        x
#endif

//------------------------------------------------------------------------------
// Debug logging:

/** Set the sink for the debug journal.

    @param sink unique_ptr to new debug Sink.
    @return unique_ptr to the previous Sink.  nullptr if there was no Sink.
*/
std::unique_ptr<beast::Journal::Sink>
setDebugLogSink(std::unique_ptr<beast::Journal::Sink> sink);

/** Returns a debug journal.
    The journal may drain to a null sink, so its output
    may never be seen. Never use it for critical
    information.
*/
beast::Journal
debugLog();

}  // namespace trustnet

#endif
