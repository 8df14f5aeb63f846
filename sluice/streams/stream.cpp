// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"

#include <string.h>

#include "sluice/exception.h"

namespace Sluice {

size_t
Stream::read(Buffer &buffer, size_t length)
{
    iovec iov = buffer.writeBuffer(length);
    size_t result = read(iov.iov_base, iov.iov_len);
    buffer.produce(result);
    return result;
}

size_t
Stream::read(void *buffer, size_t length)
{
    Buffer staging;
    size_t result = read(staging, length);
    SLUICE_ASSERT(staging.readAvailable() == result);
    staging.copyOut(buffer, result);
    return result;
}

size_t
Stream::write(const Buffer &buffer, size_t length)
{
    iovec iov = buffer.readBuffer(length);
    return write(iov.iov_base, iov.iov_len);
}

size_t
Stream::write(const void *buffer, size_t length)
{
    return write(Buffer(buffer, length), length);
}

size_t
Stream::write(const char *string)
{
    return write((const void *)string, strlen(string));
}

std::string
Stream::getDelimited(char delimiter, size_t limit)
{
    ptrdiff_t offset = find(delimiter, limit);
    if (offset < 0) {
        if ((size_t)(-offset - 1) >= limit)
            SLUICE_THROW_EXCEPTION(BufferOverflowException());
        SLUICE_THROW_EXCEPTION(UnexpectedEofException());
    }
    std::string result(offset + 1, '\0');
    size_t filled = 0;
    while (filled < result.size()) {
        size_t got = read(&result[filled], result.size() - filled);
        SLUICE_ASSERT(got > 0);
        filled += got;
    }
    result.resize(offset);
    return result;
}

}
