#ifndef __SLUICE_LIMITED_STREAM_H__
#define __SLUICE_LIMITED_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "filter.h"

namespace Sluice {

/// The next size bytes of its parent, as a Stream of its own; frames a
/// Content-Length message body
class LimitedStream : public FilterStream
{
public:
    typedef boost::shared_ptr<LimitedStream> ptr;

    /// @param strict EOF from the parent before size bytes is an
    /// UnexpectedEofException rather than a short body
    LimitedStream(Stream::ptr parent, unsigned long long size,
        bool strict = true, bool own = false);

    unsigned long long position() const { return m_position; }
    unsigned long long size() const { return m_size; }

    using FilterStream::read;
    size_t read(Buffer &buffer, size_t length);
    using FilterStream::write;
    size_t write(const Buffer &buffer, size_t length);

private:
    size_t clamp(size_t length) const;

private:
    unsigned long long m_position, m_size;
    bool m_strict;
};

}

#endif
