#ifndef __SLUICE_MEMORY_STREAM_H__
#define __SLUICE_MEMORY_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"

namespace Sluice {

/// Both ends of a connection held in memory
///
/// Reads drain the input the MemoryStream was constructed with; writes
/// accumulate separately in written().  A server handed one sees the input as
/// its requests, and leaves its responses in written().
class MemoryStream : public Stream
{
public:
    typedef boost::shared_ptr<MemoryStream> ptr;

    MemoryStream() {}
    explicit MemoryStream(const Buffer &input) : m_input(input) {}

    using Stream::read;
    size_t read(Buffer &buffer, size_t length);
    using Stream::write;
    size_t write(const Buffer &buffer, size_t length);

    /// Input not yet read
    const Buffer &remaining() const { return m_input; }
    const Buffer &written() const { return m_output; }

private:
    Buffer m_input, m_output;
};

}

#endif
