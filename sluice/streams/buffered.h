#ifndef __SLUICE_BUFFERED_STREAM_H__
#define __SLUICE_BUFFERED_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <boost/exception_ptr.hpp>

#include "filter.h"

namespace Sluice {

/// Read-ahead and write coalescing over a connection
///
/// A read is served from what was read ahead, or else by one read of up to
/// bufferSize() from the parent, so it may be short.  find() reads ahead
/// until the delimiter turns up.  A write is always accepted in full; once
/// bufferSize() bytes are pending they are pushed to the parent.
class BufferedStream : public FilterStream
{
public:
    typedef boost::shared_ptr<BufferedStream> ptr;

    BufferedStream(Stream::ptr parent, bool own = true);

    size_t bufferSize() const { return m_bufferSize; }
    void bufferSize(size_t bufferSize) { m_bufferSize = bufferSize; }

    void close(CloseType type = BOTH);
    using FilterStream::read;
    size_t read(Buffer &buffer, size_t length);
    using FilterStream::write;
    size_t write(const Buffer &buffer, size_t length);
    void flush(bool flushParent = true);
    ptrdiff_t find(char delimiter, size_t limit);

private:
    void pushWrites(size_t threshold);

private:
    size_t m_bufferSize;
    Buffer m_readAhead, m_pending;
    // A write failure that surfaced after the caller's bytes had been
    // accepted; the next write() or flush() reports it
    boost::exception_ptr m_writeFailure;
};

}

#endif
