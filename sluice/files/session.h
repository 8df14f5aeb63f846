#ifndef __SLUICE_FILES_SESSION_H__
#define __SLUICE_FILES_SESSION_H__
// Copyright (c) 2026 - Sluice contributors

#include <iosfwd>

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include "chunk_source.h"
#include "range.h"

namespace Sluice {

/// The state of one download in flight
///
/// INIT -> RANGE_PARSED -> STREAMING -> (COMPLETED | CANCELLED | FAILED);
/// INIT -> FAILED if the range is invalid.  Entering a terminal state
/// releases the resource handle.
class StreamSession : boost::noncopyable
{
public:
    typedef boost::shared_ptr<StreamSession> ptr;

    enum State {
        INIT,
        RANGE_PARSED,
        STREAMING,
        COMPLETED,
        CANCELLED,
        FAILED
    };

public:
    StreamSession(ResourceHandle::ptr handle);
    ~StreamSession();

    State state() const { return m_state; }
    bool terminal() const { return m_state >= COMPLETED; }
    bool cancelled() const { return m_state == CANCELLED; }

    /// Metadata as captured when the resource was opened
    const Resource &resource() const { return m_resource; }
    /// NULL once the session is terminal
    ResourceHandle::ptr handle() const { return m_handle; }

    /// Resolve the Range header against the resource length
    /// @throws InvalidRangeException after moving to FAILED
    const ResolvedRange &resolve(bool hasRange, const std::string &header);
    /// @pre state() >= RANGE_PARSED
    const ResolvedRange &range() const { return m_range; }

    /// Offset of the next byte to be delivered
    unsigned long long cursor() const { return m_cursor; }
    /// Bytes of the range not yet delivered
    unsigned long long remaining() const
    { return m_range.start + m_range.length - m_cursor; }
    void advance(size_t bytes);

    /// Set when the resource returned a short read
    bool exhausted() const { return m_exhausted; }
    void exhausted(bool exhausted) { m_exhausted = exhausted; }

    void startStreaming();
    void complete();
    /// Mark the session cancelled; whoever is pulling chunks stops at the
    /// next chunk boundary
    void cancel();
    void fail();

private:
    void transition(State state);

private:
    State m_state;
    ResourceHandle::ptr m_handle;
    Resource m_resource;
    ResolvedRange m_range;
    unsigned long long m_cursor;
    bool m_exhausted;
};

std::ostream &operator <<(std::ostream &os, StreamSession::State state);

}

#endif
