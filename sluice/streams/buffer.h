#ifndef __SLUICE_BUFFER_H__
#define __SLUICE_BUFFER_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <stddef.h>
#include <sys/uio.h>

#include <string>
#include <vector>

namespace Sluice {

/// A queue of bytes with separate read and write regions
///
/// Data is produced at the back of the write region and consumed from the
/// front of the read region.  Storage is a single contiguous block that is
/// compacted or grown by reserve(), so a readBuffer() or writeBuffer() is
/// always one iovec.
struct Buffer
{
public:
    Buffer();
    Buffer(const char *string);
    Buffer(const std::string &string);
    Buffer(const void *data, size_t length);

    /// Bytes available to be consumed
    size_t readAvailable() const;
    /// Bytes that can be produced without another allocation
    size_t writeAvailable() const;

    /// Ensure at least length bytes can be produced
    void reserve(size_t length);
    void clear();
    /// Mark length bytes of the write region as readable
    void produce(size_t length);
    /// Discard length bytes from the front of the read region
    void consume(size_t length);
    /// Discard everything past the first length readable bytes
    void truncate(size_t length);

    const iovec readBuffer(size_t length = ~0) const;
    /// @note reserves length bytes first
    iovec writeBuffer(size_t length);

    void copyIn(const Buffer &buf, size_t length = ~0);
    void copyIn(const char *string);
    void copyIn(const void *data, size_t length);

    void copyOut(Buffer &buffer, size_t length) const
    { buffer.copyIn(*this, length); }
    void copyOut(void *buffer, size_t length) const;

    /// @return offset of delimiter within the first length readable bytes,
    /// or -1
    ptrdiff_t find(char delimiter, size_t length = ~0) const;

    std::string toString() const;

    bool operator== (const Buffer &rhs) const;
    bool operator== (const std::string &str) const;
    bool operator== (const char *str) const;

private:
    void compact();
    int opCmp(const void *data, size_t length) const;
    void invariant() const;

private:
    std::vector<unsigned char> m_data;
    size_t m_readIndex, m_writeIndex;
};

}

#endif
