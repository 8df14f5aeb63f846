// Copyright (c) 2009 - Mozy, Inc.

#include "limited.h"

#include "sluice/exception.h"

namespace Sluice {

LimitedStream::LimitedStream(Stream::ptr parent, unsigned long long size,
    bool strict, bool own)
: FilterStream(parent, own),
  m_position(0),
  m_size(size),
  m_strict(strict)
{}

size_t
LimitedStream::clamp(size_t length) const
{
    unsigned long long left = m_size - m_position;
    return left < length ? (size_t)left : length;
}

size_t
LimitedStream::read(Buffer &buffer, size_t length)
{
    length = clamp(length);
    if (length == 0)
        return 0;
    size_t result = parent()->read(buffer, length);
    if (result == 0 && m_strict)
        SLUICE_THROW_EXCEPTION(UnexpectedEofException());
    m_position += result;
    return result;
}

size_t
LimitedStream::write(const Buffer &buffer, size_t length)
{
    length = clamp(length);
    if (length == 0)
        SLUICE_THROW_EXCEPTION(WriteBeyondEofException());
    size_t result = parent()->write(buffer, length);
    m_position += result;
    return result;
}

}
