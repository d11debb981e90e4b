//------------------------------------------------------------------------------
/*
    This file is part of cooler.
    Copyright (c) 2026 The cooler developers.

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

#ifndef COOLER_BASICS_JOURNAL_H_INCLUDED
#define COOLER_BASICS_JOURNAL_H_INCLUDED

#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace cooler {

/** A generic endpoint for log messages.

    The Journal has a single Sink. Each severity level has an associated
    Stream which formats into a temporary buffer and hands the finished text
    to the Sink when the statement ends.

    Journals are cheap to copy and are passed by value.
*/
class Journal
{
public:
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

    /** Abstraction for the underlying message destination. */
    class Sink
    {
    protected:
        Sink() = delete;
        explicit Sink(Sink const& sink) = default;
        Sink(Severity thresh, bool console);
        Sink&
        operator=(Sink const& lhs) = delete;

    public:
        virtual ~Sink() = 0;

        /** Returns `true` if text at the passed severity produces output. */
        virtual bool
        active(Severity level) const;

        /** Returns `true` if a message is also written to the console. */
        virtual bool
        console() const;

        /** Set whether messages are also written to the console. */
        virtual void
        console(bool output);

        /** Returns the minimum severity level this sink will report. */
        virtual Severity
        threshold() const;

        /** Set the minimum severity this sink will report. */
        virtual void
        threshold(Severity thresh);

        /** Write text to the sink at the specified severity.
            The caller is responsible for checking the minimum severity level
            before using this function.
        */
        virtual void
        write(Severity level, std::string const& text) = 0;

    private:
        Severity thresh_;
        bool m_console;
    };

    /** Returns a Sink which does nothing. */
    static Sink&
    getNullSink();

    class Stream;

    /** Scoped ostream-based container for writing messages to a Journal. */
    class ScopedStream
    {
    public:
        ScopedStream(ScopedStream const& other)
            : ScopedStream(other.m_sink, other.m_level)
        {
        }

        ScopedStream(Sink& sink, Severity level);

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
        Severity const m_level;
        std::ostringstream mutable m_ostream;
    };

    /** Provide a light-weight way to check active() before string formatting */
    class Stream
    {
    public:
        /** Create a stream which produces no output. */
        explicit Stream() : m_sink(getNullSink()), m_level(kDisabled)
        {
        }

        /** Create a stream that writes at the given level. */
        Stream(Sink& sink, Severity level) : m_sink(sink), m_level(level)
        {
        }

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
        Severity
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
        Severity m_level;
    };

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
    stream(Severity level) const
    {
        return Stream(*m_sink, level);
    }

    /** Returns `true` if any message would be logged at this severity level.
        For a message to be logged, the severity must be at or above the
        sink's severity threshold.
    */
    bool
    active(Severity level) const
    {
        return m_sink->active(level);
    }

    /** Severity stream access functions. */
    /** @{ */
    Stream
    trace() const
    {
        return {*m_sink, kTrace};
    }

    Stream
    debug() const
    {
        return {*m_sink, kDebug};
    }

    Stream
    info() const
    {
        return {*m_sink, kInfo};
    }

    Stream
    warn() const
    {
        return {*m_sink, kWarning};
    }

    Stream
    error() const
    {
        return {*m_sink, kError};
    }

    Stream
    fatal() const
    {
        return {*m_sink, kFatal};
    }
    /** @} */

private:
    Sink* m_sink;
};

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

template <typename T>
Journal::ScopedStream
Journal::Stream::operator<<(T const& t) const
{
    return ScopedStream(*this, t);
}

//------------------------------------------------------------------------------

/** A Sink that writes each message as a line to an ostream. */
class StreamSink : public Journal::Sink
{
public:
    explicit StreamSink(
        std::ostream& os,
        Journal::Severity thresh = Journal::kWarning);

    void
    write(Journal::Severity level, std::string const& text) override;

private:
    std::mutex mutex_;
    std::ostream& os_;
};

/** Returns a short name for a severity, such as "WRN". */
std::string
toString(Journal::Severity level);

/** Returns a debug journal.
    The journal may drain to a null sink, so its output may never be seen.
    Never use it for critical information.
*/
Journal
debugLog();

/** Set the sink for the debug journal.

    @param sink unique_ptr to new debug Sink.
    @return unique_ptr to the previous Sink. nullptr if there was no Sink.
*/
std::unique_ptr<Journal::Sink>
setDebugLogSink(std::unique_ptr<Journal::Sink> sink);

}  // namespace cooler

// Wraps a Journal::Stream to skip evaluation of expensive argument lists if the
// stream is not active.
#ifndef JLOG
#define JLOG(x) \
    if (!x)     \
    {           \
    }           \
    else        \
        x
#endif

#endif
