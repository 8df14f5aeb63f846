// Copyright (c) 2026 - Sluice contributors

#include "session.h"

#include <ostream>

#include "sluice/assert.h"
#include "sluice/log.h"

namespace Sluice {

static Logger::ptr g_log = Log::lookup("sluice:files:session");

StreamSession::StreamSession(ResourceHandle::ptr handle)
: m_state(INIT),
  m_handle(handle),
  m_cursor(0),
  m_exhausted(false)
{
    SLUICE_ASSERT(m_handle);
    m_resource = m_handle->resource();
    SLUICE_LOG_DEBUG(g_log) << this << " " << m_resource.key << " ("
        << m_resource.length << " bytes) " << m_state;
}

StreamSession::~StreamSession()
{
    if (!terminal()) {
        SLUICE_LOG_VERBOSE(g_log) << this << " abandoned in " << m_state;
        m_handle.reset();
    }
}

const ResolvedRange &
StreamSession::resolve(bool hasRange, const std::string &header)
{
    SLUICE_ASSERT(m_state == INIT);
    try {
        m_range = RangeParser::parse(hasRange, header, m_resource.length);
    } catch (InvalidRangeException &ex) {
        SLUICE_LOG_DEBUG(g_log) << this << " invalid range '" << header
            << "': " << ex.what();
        fail();
        throw;
    }
    m_cursor = m_range.start;
    transition(RANGE_PARSED);
    return m_range;
}

void
StreamSession::advance(size_t bytes)
{
    SLUICE_ASSERT(bytes <= remaining());
    m_cursor += bytes;
}

void
StreamSession::startStreaming()
{
    SLUICE_ASSERT(m_state == RANGE_PARSED);
    transition(STREAMING);
}

void
StreamSession::complete()
{
    SLUICE_ASSERT(m_state == RANGE_PARSED || m_state == STREAMING);
    transition(COMPLETED);
}

void
StreamSession::cancel()
{
    if (terminal())
        return;
    transition(CANCELLED);
}

void
StreamSession::fail()
{
    if (terminal())
        return;
    transition(FAILED);
}

void
StreamSession::transition(State state)
{
    SLUICE_LOG_DEBUG(g_log) << this << " " << m_state << " -> " << state
        << " at " << m_cursor;
    m_state = state;
    if (terminal() && m_handle) {
        ResourceHandle::ptr handle;
        handle.swap(m_handle);
        try {
            handle->close();
        } catch (NativeException &) {
            SLUICE_LOG_ERROR(g_log) << this << " unable to release "
                << m_resource.key << ": "
                << boost::current_exception_diagnostic_information();
        }
    }
}

std::ostream &
operator <<(std::ostream &os, StreamSession::State state)
{
    switch (state) {
        case StreamSession::INIT:
            return os << "INIT";
        case StreamSession::RANGE_PARSED:
            return os << "RANGE_PARSED";
        case StreamSession::STREAMING:
            return os << "STREAMING";
        case StreamSession::COMPLETED:
            return os << "COMPLETED";
        case StreamSession::CANCELLED:
            return os << "CANCELLED";
        case StreamSession::FAILED:
            return os << "FAILED";
        default:
            return os << (int)state;
    }
}

}
