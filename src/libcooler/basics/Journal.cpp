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

#include <cooler/basics/Journal.h>

#include <functional>
#include <iostream>

namespace cooler {

// A Sink that does nothing.
class NullJournalSink : public Journal::Sink
{
public:
    NullJournalSink() : Sink(Journal::kDisabled, false)
    {
    }

    ~NullJournalSink() override = default;

    bool
    active(Journal::Severity) const override
    {
        return false;
    }

    bool
    console() const override
    {
        return false;
    }

    void
    console(bool) override
    {
    }

    Journal::Severity
    threshold() const override
    {
        return Journal::kDisabled;
    }

    void
    threshold(Journal::Severity) override
    {
    }

    void
    write(Journal::Severity, std::string const&) override
    {
    }
};

//------------------------------------------------------------------------------

Journal::Sink&
Journal::getNullSink()
{
    static NullJournalSink sink;
    return sink;
}

//------------------------------------------------------------------------------

Journal::Sink::Sink(Severity thresh, bool console)
    : thresh_(thresh), m_console(console)
{
}

Journal::Sink::~Sink() = default;

bool
Journal::Sink::active(Severity level) const
{
    return level >= thresh_;
}

bool
Journal::Sink::console() const
{
    return m_console;
}

void
Journal::Sink::console(bool output)
{
    m_console = output;
}

Journal::Severity
Journal::Sink::threshold() const
{
    return thresh_;
}

void
Journal::Sink::threshold(Severity thresh)
{
    thresh_ = thresh;
}

//------------------------------------------------------------------------------

Journal::ScopedStream::ScopedStream(Sink& sink, Severity level)
    : m_sink(sink), m_level(level)
{
    // Modifiers applied from all ctors
    m_ostream << std::boolalpha << std::showbase;
}

Journal::ScopedStream::ScopedStream(
    Stream const& stream,
    std::ostream& manip(std::ostream&))
    : ScopedStream(stream.sink(), stream.level())
{
    m_ostream << manip;
}

Journal::ScopedStream::~ScopedStream()
{
    std::string const& s(m_ostream.str());
    if (!s.empty())
    {
        if (s == "\n")
            m_sink.write(m_level, "");
        else
            m_sink.write(m_level, s);
    }
}

std::ostream&
Journal::ScopedStream::operator<<(std::ostream& manip(std::ostream&)) const
{
    return m_ostream << manip;
}

Journal::ScopedStream
Journal::Stream::operator<<(std::ostream& manip(std::ostream&)) const
{
    return ScopedStream(*this, manip);
}

//------------------------------------------------------------------------------

StreamSink::StreamSink(std::ostream& os, Journal::Severity thresh)
    : Sink(thresh, false), os_(os)
{
}

void
StreamSink::write(Journal::Severity level, std::string const& text)
{
    if (level < threshold())
        return;

    std::lock_guard lock(mutex_);
    os_ << toString(level) << ":" << text << std::endl;
}

std::string
toString(Journal::Severity level)
{
    switch (level)
    {
        case Journal::kTrace:
            return "TRC";
        case Journal::kDebug:
            return "DBG";
        case Journal::kInfo:
            return "NFO";
        case Journal::kWarning:
            return "WRN";
        case Journal::kError:
            return "ERR";
        case Journal::kFatal:
            return "FTL";
        default:
            break;
    }
    return "???";
}

//------------------------------------------------------------------------------

namespace {

class DebugSink
{
private:
    std::reference_wrapper<Journal::Sink> sink_;
    std::unique_ptr<Journal::Sink> holder_;
    std::mutex m_;

public:
    DebugSink() : sink_(Journal::getNullSink())
    {
    }

    DebugSink(DebugSink const&) = delete;
    DebugSink&
    operator=(DebugSink const&) = delete;

    std::unique_ptr<Journal::Sink>
    set(std::unique_ptr<Journal::Sink> sink)
    {
        std::lock_guard _(m_);

        using std::swap;
        swap(holder_, sink);

        if (holder_)
            sink_ = *holder_;
        else
            sink_ = Journal::getNullSink();

        return sink;
    }

    Journal::Sink&
    get()
    {
        std::lock_guard _(m_);
        return sink_.get();
    }
};

DebugSink&
debugSink()
{
    static DebugSink _;
    return _;
}

}  // namespace

std::unique_ptr<Journal::Sink>
setDebugLogSink(std::unique_ptr<Journal::Sink> sink)
{
    return debugSink().set(std::move(sink));
}

Journal
debugLog()
{
    return Journal(debugSink().get());
}

}  // namespace cooler
