// Copyright (c) 2026 - Sluice contributors

#include "chunk_scheduler.h"

#include <algorithm>

#include "sluice/assert.h"
#include "sluice/log.h"
#include "session.h"

namespace Sluice {

static Logger::ptr g_log = Log::lookup("sluice:files:chunkscheduler");

ChunkScheduler::ChunkScheduler(StreamSession &session, size_t chunkSize)
: m_session(session),
  m_chunkSize(chunkSize),
  m_index(0)
{
    SLUICE_ASSERT(m_chunkSize > 0);
}

bool
ChunkScheduler::next(Chunk &chunk)
{
    if (m_session.terminal() || m_session.exhausted() ||
        m_session.remaining() == 0)
        return false;
    ResourceHandle::ptr handle = m_session.handle();
    SLUICE_ASSERT(handle);
    size_t toRead = (size_t)std::min<unsigned long long>(m_chunkSize,
        m_session.remaining());
    chunk.data.clear();
    chunk.offset = m_session.cursor();
    size_t result = handle->readAt(chunk.offset, chunk.data, toRead);
    SLUICE_ASSERT(result <= toRead);
    if (result < toRead) {
        SLUICE_LOG_VERBOSE(g_log) << &m_session << " short read at "
            << chunk.offset << ": " << result << " of " << toRead;
        m_session.exhausted(true);
        if (result == 0)
            return false;
    }
    m_session.advance(result);
    chunk.index = m_index++;
    SLUICE_LOG_TRACE(g_log) << &m_session << " chunk " << chunk.index
        << " [" << chunk.offset << ", " << chunk.offset + result << ")";
    return true;
}

}
