#ifndef __SLUICE_STREAM_H__
#define __SLUICE_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <string>

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include "sluice/assert.h"
#include "buffer.h"

namespace Sluice {

/// @brief Byte-oriented stream
///
/// Everything that moves bytes through a connection is a Stream: the socket,
/// read and write buffering, Content-Length framing, the chunked transfer
/// coding, and the in-memory streams tests drive servers with.  A subclass
/// overrides one overload each of read() and write(); the other overload
/// adapts to it.
///
/// Any call may suspend the calling Fiber while the transport isn't ready.
/// That suspension is the only backpressure there is.
class Stream : boost::noncopyable
{
public:
    typedef boost::shared_ptr<Stream> ptr;

    enum CloseType {
        READ  = 0x01,
        WRITE = 0x02,
        BOTH  = 0x03
    };

public:
    virtual ~Stream() {}

    virtual void close(CloseType type = BOTH) {}

    /// @return Up to length bytes; 0 only at EOF
    virtual size_t read(Buffer &buffer, size_t length);
    virtual size_t read(void *buffer, size_t length);
    /// Make a pending or future read() fail with OperationAbortedException
    virtual void cancelRead() {}

    /// @return At least one byte, and at most length
    virtual size_t write(const Buffer &buffer, size_t length);
    virtual size_t write(const void *buffer, size_t length);
    size_t write(const char *string);
    /// Make a pending or future write() fail with OperationAbortedException
    virtual void cancelWrite() {}

    /// Push buffered writes to the transport
    virtual void flush(bool flushParent = true) {}

    /// Look for delimiter among the next limit readable bytes, reading more
    /// as necessary; consumes nothing
    /// @return The offset of delimiter, or -(bytes available) - 1 if it
    /// isn't within limit bytes or EOF came first
    virtual ptrdiff_t find(char delimiter, size_t limit)
    { SLUICE_NOTREACHED(); }

    /// Consume through the next delimiter
    /// @return The text before the delimiter
    /// @throws BufferOverflowException delimiter isn't within limit bytes
    /// @throws UnexpectedEofException EOF came before delimiter
    std::string getDelimited(char delimiter = '\n', size_t limit = 65536);
};

}

#endif
