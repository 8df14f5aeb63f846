// Copyright (c) 2009 - Mozy, Inc.

#include "buffer.h"

#include <string.h>

#include <algorithm>

#include "sluice/assert.h"

namespace Sluice {

Buffer::Buffer()
: m_readIndex(0),
  m_writeIndex(0)
{}

Buffer::Buffer(const char *string)
: m_readIndex(0),
  m_writeIndex(0)
{
    copyIn(string, strlen(string));
}

Buffer::Buffer(const std::string &string)
: m_readIndex(0),
  m_writeIndex(0)
{
    copyIn(string.c_str(), string.size());
}

Buffer::Buffer(const void *data, size_t length)
: m_readIndex(0),
  m_writeIndex(0)
{
    copyIn(data, length);
}

size_t
Buffer::readAvailable() const
{
    return m_writeIndex - m_readIndex;
}

size_t
Buffer::writeAvailable() const
{
    return m_data.size() - m_writeIndex;
}

void
Buffer::reserve(size_t length)
{
    if (writeAvailable() >= length)
        return;
    compact();
    if (writeAvailable() < length)
        m_data.resize(m_writeIndex + length);
    invariant();
}

void
Buffer::compact()
{
    if (m_readIndex == 0)
        return;
    size_t available = readAvailable();
    if (available > 0)
        memmove(&m_data[0], &m_data[m_readIndex], available);
    m_readIndex = 0;
    m_writeIndex = available;
    invariant();
}

void
Buffer::clear()
{
    m_data.clear();
    m_readIndex = m_writeIndex = 0;
}

void
Buffer::produce(size_t length)
{
    SLUICE_ASSERT(length <= writeAvailable());
    m_writeIndex += length;
    invariant();
}

void
Buffer::consume(size_t length)
{
    SLUICE_ASSERT(length <= readAvailable());
    m_readIndex += length;
    if (m_readIndex == m_writeIndex)
        m_readIndex = m_writeIndex = 0;
    invariant();
}

void
Buffer::truncate(size_t length)
{
    SLUICE_ASSERT(length <= readAvailable());
    m_writeIndex = m_readIndex + length;
    invariant();
}

const iovec
Buffer::readBuffer(size_t length) const
{
    iovec result;
    result.iov_len = std::min(length, readAvailable());
    result.iov_base = result.iov_len == 0 ? NULL :
        (void *)&m_data[m_readIndex];
    return result;
}

iovec
Buffer::writeBuffer(size_t length)
{
    reserve(length);
    iovec result;
    result.iov_len = length;
    result.iov_base = length == 0 ? NULL : (void *)&m_data[m_writeIndex];
    return result;
}

void
Buffer::copyIn(const Buffer &buf, size_t length)
{
    length = std::min(length, buf.readAvailable());
    if (length == 0)
        return;
    if (&buf == this) {
        std::vector<unsigned char> copy(&m_data[m_readIndex],
            &m_data[m_readIndex] + length);
        copyIn(&copy[0], length);
        return;
    }
    copyIn(&buf.m_data[buf.m_readIndex], length);
}

void
Buffer::copyIn(const char *string)
{
    copyIn(string, strlen(string));
}

void
Buffer::copyIn(const void *data, size_t length)
{
    if (length == 0)
        return;
    reserve(length);
    memcpy(&m_data[m_writeIndex], data, length);
    produce(length);
}

void
Buffer::copyOut(void *buffer, size_t length) const
{
    SLUICE_ASSERT(length <= readAvailable());
    if (length == 0)
        return;
    memcpy(buffer, &m_data[m_readIndex], length);
}

ptrdiff_t
Buffer::find(char delimiter, size_t length) const
{
    length = std::min(length, readAvailable());
    if (length == 0)
        return -1;
    const unsigned char *start = &m_data[m_readIndex];
    const void *found = memchr(start, delimiter, length);
    if (!found)
        return -1;
    return (const unsigned char *)found - start;
}

std::string
Buffer::toString() const
{
    if (readAvailable() == 0)
        return std::string();
    return std::string((const char *)&m_data[m_readIndex], readAvailable());
}

int
Buffer::opCmp(const void *data, size_t length) const
{
    size_t available = readAvailable();
    size_t common = std::min(available, length);
    int result = common == 0 ? 0 : memcmp(&m_data[m_readIndex], data, common);
    if (result != 0)
        return result;
    if (available == length)
        return 0;
    return available < length ? -1 : 1;
}

bool
Buffer::operator== (const Buffer &rhs) const
{
    if (rhs.readAvailable() != readAvailable())
        return false;
    return readAvailable() == 0 ||
        opCmp(&rhs.m_data[rhs.m_readIndex], rhs.readAvailable()) == 0;
}

bool
Buffer::operator== (const std::string &str) const
{
    return opCmp(str.c_str(), str.size()) == 0;
}

bool
Buffer::operator== (const char *str) const
{
    return opCmp(str, strlen(str)) == 0;
}

void
Buffer::invariant() const
{
    SLUICE_ASSERT(m_readIndex <= m_writeIndex);
    SLUICE_ASSERT(m_writeIndex <= m_data.size());
}

}
