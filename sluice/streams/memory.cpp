// Copyright (c) 2009 - Mozy, Inc.

#include "memory.h"

#include <algorithm>

namespace Sluice {

size_t
MemoryStream::read(Buffer &buffer, size_t length)
{
    length = std::min(length, m_input.readAvailable());
    buffer.copyIn(m_input, length);
    m_input.consume(length);
    return length;
}

size_t
MemoryStream::write(const Buffer &buffer, size_t length)
{
    length = std::min(length, buffer.readAvailable());
    m_output.copyIn(buffer, length);
    return length;
}

}
