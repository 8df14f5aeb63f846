#ifndef __SLUICE_FILES_CHUNK_SCHEDULER_H__
#define __SLUICE_FILES_CHUNK_SCHEDULER_H__
// Copyright (c) 2026 - Sluice contributors

#include <boost/noncopyable.hpp>

#include "sluice/streams/buffer.h"

namespace Sluice {

class StreamSession;

struct Chunk
{
    Chunk() : index(0), offset(0) {}

    /// Position in the sequence, starting at 0
    unsigned long long index;
    /// Offset of the first byte of data within the resource
    unsigned long long offset;
    Buffer data;
};

/// Lazily splits a session's range into chunks
///
/// Nothing is read from the resource until next() is called, and each call
/// reads exactly one chunk, so a consumer that stops pulling stops the
/// reads.  The sequence ends at the end of the range, at a short read, or
/// as soon as the session is no longer streamable.
class ChunkScheduler : boost::noncopyable
{
public:
    ChunkScheduler(StreamSession &session, size_t chunkSize);

    size_t chunkSize() const { return m_chunkSize; }
    /// Number of chunks handed out so far
    unsigned long long chunksIssued() const { return m_index; }

    /// Replace the contents of chunk with the next one
    /// @return false if the sequence is over
    /// @throws ChunkReadException
    bool next(Chunk &chunk);

private:
    StreamSession &m_session;
    size_t m_chunkSize;
    unsigned long long m_index;
};

}

#endif
