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

#ifndef TRUSTNET_BEAST_UTILITY_JOURNAL_H_INCLUDED
#define TRUSTNET_BEAST_UTILITY_JOURNAL_H_INCLUDED

#include <sstream>
#include <string>
#include <type_traits>

namespace beast {

/** A namespace for easy access to logging severity values. */
namespace severities {
/** Severity level / threshold of a Journal message. */
enum Severity {
    kAll = 0,

    kTrace = kAll,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kFatal,

    kDisabled,
    kNone = kDisabled
};
}  // namespace severities

/** A generic endpoint for log messages.

    The Journal has a few simple goals:

     * To be light-weight and copied by value.
     * To allow logging statements to be left in source code.
     * The logging is controlled in the value of the Sink, which may
       be changed without touching the code that writes the messages.

    A Journal holds a reference to a Sink it does not own; the Sink must
    outlive every Journal that refers to it.
*/
class Journal
{
public:
    class Sink;

private:
    // Invariant: m_sink always points to a valid Sink
    Sink* m_sink;

public:
    //--------------------------------------------------------------------------

    /** Abstraction for the underlying message destination. */
    class Sink
    {
    protected:
        Sink() = delete;
        explicit Sink(Sink const& sink) = default;
        Sink(severities::Severity thresh, bool console);
        Sink&
        operator=(Sink const& lhs) = delete;

    public:
        virtual ~Sink() = 0;

        /** Returns `true` if text at the passed severity produces output. */
        virtual bool
        active(severities::Severity level) const;

        /** Returns `true` if a message is also written to the Output Window
         * (MSVC). */
        virtual bool
        console() const;

        /** Set whether messages are also written to the Output Window (MSVC).
         */
        virtual void
        console(bool output);

        /** Returns the minimum severity level this sink will report. */
        virtual severities::Severity
        threshold() const;

        /** Set the minimum severity this sink will report. */
        virtual void
        threshold(severities::Severity thresh);

        /** Write text to the sink at the specified severity.
            A conforming implementation will not write the text if the passed
            level is below the current threshold().
        */
        virtual void
        write(severities::Severity level, std::string const& text) = 0;

    private:
        severities::Severity thresh_;
        bool m_console;
    };

#ifndef __INTELLISENSE__
    static_assert(!std::is_default_constructible<Sink>::value, "");
    static_assert(!std::is_copy_constructible<Sink>::value, "");
    static_assert(!std::is_move_constructible<Sink>::value, "");
    static_assert(!std::is_copy_assignable<Sink>::value, "");
    static_assert(!std::is_move_assignable<Sink>::value, "");
    static_assert(std::is_nothrow_destructible<Sink>::value == true, "");
#endif

    /** Returns a Sink which does nothing. */
    static Sink&
    getNullSink();

    //--------------------------------------------------------------------------

    class Stream;

    /* Scoped ostream-based container for writing messages to a Journal. */
    class ScopedStream
    {
    public:
        ScopedStream(ScopedStream const& other)
            : ScopedStream(other.m_sink, other.m_level)
        {
        }

        ScopedStream(Sink& sink, severities::Severity level);

        template <typename T>
        ScopedStream(Stream const& stream, T const& t);

        ScopedStream(
            Stream const& stream,
            std::ostream& manip(std::ostream&));

        ScopedStream&
        operator=(ScopedStream const&) = delete;

        ~ScopedStream();

        std::ostringstream&
        ostream() const
        {
            return m_ostream;
        }

        std::ostream&
        operator<<(std::ostream& manip(std::ostream&)) const;

        template <typename T>
        std::ostream&
        operator<<(T const& t) const;

    private:
        Sink& m_sink;
        severities::Severity const m_level;
        std::ostringstream mutable m_ostream;
    };

    //--------------------------------------------------------------------------

    /** Provide a light-weight way to check active() before string formatting
     */
    class Stream
    {
    public:
        /** Create a stream which produces no output. */
        explicit Stream()
            : m_sink(getNullSink()), m_level(severities::kDisabled)
        {
        }

        /** Create a stream that writes at the given level. */
        Stream(Sink& sink, severities::Severity level)
            : m_sink(sink), m_level(level)
        {
        }

        /** Construct or copy another Stream. */
        Stream(Stream const& other) : Stream(other.m_sink, other.m_level)
        {
        }

        Stream&
        operator=(Stream const& other) = delete;

        /** Returns the Sink that this Stream writes to. */
        Sink&
        sink() const
        {
            return m_sink;
        }

        /** Returns the Severity level of messages this Stream reports. */
        severities::Severity
        level() const
        {
            return m_level;
        }

        /** Returns `true` if sink logs anything at this stream's level. */
        bool
        active() const
        {
            return m_sink.active(m_level);
        }

        /** Output stream support. */
        explicit
        operator bool() const
        {
            return active();
        }

        ScopedStream
        operator<<(std::ostream& manip(std::ostream&)) const;

        template <typename T>
        ScopedStream
        operator<<(T const& t) const;

    private:
        Sink& m_sink;
        severities::Severity m_level;
    };

    //--------------------------------------------------------------------------

    /** Journal has no default constructor. */
    Journal() = delete;

    /** Create a journal that writes to the specified sink. */
    explicit Journal(Sink& sink) : m_sink(&sink)
    {
    }

    /** Returns the Sink associated with this Journal. */
    Sink&
    sink() const
    {
        return *m_sink;
    }

    /** Returns a stream for this sink, with the specified severity level. */
    Stream
    stream(severities::Severity level) const
    {
        return Stream(*m_sink, level);
    }

    /** Returns `true` if any message would be logged at this severity level.
        For a message to be logged, the severity must be at or above the
        sink's severity threshold.
    */
    bool
    active(severities::Severity level) const
    {
        return m_sink->active(level);
    }

    /** Severity stream access functions. */
    /** @{ */
    Stream
    trace() const
    {
        return {*m_sink, severities::kTrace};
    }

    Stream
    debug() const
    {
        return {*m_sink, severities::kDebug};
    }

    Stream
    info() const
    {
        return {*m_sink, severities::kInfo};
    }

    Stream
    warn() const
    {
        return {*m_sink, severities::kWarning};
    }

    Stream
    error() const
    {
        return {*m_sink, severities::kError};
    }

    Stream
    fatal() const
    {
        return {*m_sink, severities::kFatal};
    }
    /** @} */
};

#ifndef __INTELLISENSE__
static_assert(!std::is_default_constructible<Journal>::value, "");
static_assert(std::is_copy_constructible<Journal>::value, "");
static_assert(std::is_move_constructible<Journal>::value, "");
static_assert(std::is_copy_assignable<Journal>::value, "");
static_assert(std::is_move_assignable<Journal>::value, "");
static_assert(std::is_nothrow_destructible<Journal>::value == true, "");
#endif

//------------------------------------------------------------------------------

template <typename T>
Journal::ScopedStream::ScopedStream(Journal::Stream const& stream, T const& t)
    : ScopedStream(stream.sink(), stream.level())
{
    m_ostream << t;
}

template <typename T>
std::ostream&
Journal::ScopedStream::operator<<(T const& t) const
{
    m_ostream << t;
    return m_ostream;
}

//------------------------------------------------------------------------------

template <typename T>
Journal::ScopedStream
Journal::Stream::operator<<(T const& t) const
{
    return ScopedStream(*this, t);
}

//------------------------------------------------------------------------------

/** A Journal::Sink that forwards everything to another Sink, optionally
    prefixing each message.
*/
class WrappedSink : public Journal::Sink
{
private:
    Journal::Sink& sink_;
    std::string prefix_;

public:
    explicit WrappedSink(Journal::Sink& sink, std::string const& prefix = "")
        : Sink(sink), sink_(sink), prefix_(prefix)
    {
    }

    explicit WrappedSink(Journal const& journal, std::string const& prefix = "")
        : WrappedSink(journal.sink(), prefix)
    {
    }

    void
    prefix(std::string const& s)
    {
        prefix_ = s;
    }

    bool
    active(severities::Severity level) const override
    {
        return sink_.active(level);
    }

    bool
    console() const override
    {
        return sink_.console();
    }

    void
    console(bool output) override
    {
        sink_.console(output);
    }

    severities::Severity
    threshold() const override
    {
        return sink_.threshold();
    }

    void
    threshold(severities::Severity thresh) override
    {
        sink_.threshold(thresh);
    }

    void
    write(severities::Severity level, std::string const& text) override
    {
        using beast::Journal;
        sink_.write(level, prefix_ + text);
    }
};

}  // namespace beast

#endif
