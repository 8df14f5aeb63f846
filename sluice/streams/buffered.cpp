// Copyright (c) 2009 - Mozy, Inc.

#include "buffered.h"

#include <algorithm>

#include "sluice/config.h"
#include "sluice/exception.h"
#include "sluice/log.h"

namespace Sluice {

static ConfigVar<size_t>::ptr g_defaultBufferSize =
    Config::lookup<size_t>("stream.buffered.defaultbuffersize", 65536,
    "Default buffer size for new BufferedStreams");

static Logger::ptr g_log = Log::lookup("sluice:streams:buffered");

BufferedStream::BufferedStream(Stream::ptr parent, bool own)
: FilterStream(parent, own),
  m_bufferSize(g_defaultBufferSize->val())
{}

void
BufferedStream::close(CloseType type)
{
    SLUICE_LOG_VERBOSE(g_log) << this << " close(" << type << ")";
    if (type & READ)
        m_readAhead.clear();
    boost::exception_ptr failure;
    if (type & WRITE) {
        try {
            flush(false);
        } catch (std::exception &) {
            failure = boost::current_exception();
        }
    }
    FilterStream::close(type);
    if (failure)
        Sluice::rethrow_exception(failure);
}

size_t
BufferedStream::read(Buffer &buffer, size_t length)
{
    if (m_readAhead.readAvailable() == 0) {
        size_t result = parent()->read(m_readAhead,
            std::max(length, m_bufferSize));
        SLUICE_LOG_TRACE(g_log) << this << " parent()->read(): " << result;
        if (result == 0)
            return 0;
    }
    length = std::min(length, m_readAhead.readAvailable());
    buffer.copyIn(m_readAhead, length);
    m_readAhead.consume(length);
    return length;
}

size_t
BufferedStream::write(const Buffer &buffer, size_t length)
{
    if (m_writeFailure) {
        boost::exception_ptr failure = m_writeFailure;
        m_writeFailure = boost::exception_ptr();
        Sluice::rethrow_exception(failure);
    }
    length = std::min(length, buffer.readAvailable());
    m_pending.copyIn(buffer, length);
    try {
        pushWrites(m_bufferSize);
    } catch (std::exception &) {
        // None of this write reached the parent; take it back
        if (m_pending.readAvailable() >= length) {
            m_pending.truncate(m_pending.readAvailable() - length);
            throw;
        }
        SLUICE_LOG_VERBOSE(g_log) << this << " deferring write failure";
        m_writeFailure = boost::current_exception();
    }
    return length;
}

void
BufferedStream::pushWrites(size_t threshold)
{
    while (m_pending.readAvailable() > 0 &&
        m_pending.readAvailable() >= threshold) {
        size_t result = parent()->write(m_pending, m_pending.readAvailable());
        SLUICE_LOG_TRACE(g_log) << this << " parent()->write("
            << m_pending.readAvailable() << "): " << result;
        m_pending.consume(result);
    }
}

void
BufferedStream::flush(bool flushParent)
{
    if (m_writeFailure) {
        boost::exception_ptr failure = m_writeFailure;
        m_writeFailure = boost::exception_ptr();
        Sluice::rethrow_exception(failure);
    }
    pushWrites(1);
    FilterStream::flush(flushParent);
}

ptrdiff_t
BufferedStream::find(char delimiter, size_t limit)
{
    while (true) {
        ptrdiff_t offset = m_readAhead.find(delimiter, limit);
        if (offset >= 0)
            return offset;
        size_t available = m_readAhead.readAvailable();
        if (available >= limit)
            return -(ptrdiff_t)available - 1;
        size_t result = parent()->read(m_readAhead, m_bufferSize);
        SLUICE_LOG_TRACE(g_log) << this << " parent()->read(): " << result;
        if (result == 0)
            return -(ptrdiff_t)available - 1;
    }
}

}
