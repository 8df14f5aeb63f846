#ifndef __SLUICE_FILTER_STREAM_H__
#define __SLUICE_FILTER_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"

namespace Sluice {

/// A Stream layered on another
///
/// Cancellation and flushing always reach the parent.  close() only does if
/// the FilterStream owns it; a message body framed on a connection must not
/// close the connection.  find() is not forwarded, since a filter's bytes
/// are rarely its parent's.
class FilterStream : public Stream
{
public:
    FilterStream(Stream::ptr parent, bool own)
        : m_parent(parent),
          m_own(own)
    {
        SLUICE_ASSERT(m_parent);
    }

    Stream::ptr parent() const { return m_parent; }
    bool ownsParent() const { return m_own; }

    void close(CloseType type = BOTH)
    {
        if (m_own)
            m_parent->close(type);
    }
    void cancelRead() { m_parent->cancelRead(); }
    void cancelWrite() { m_parent->cancelWrite(); }
    void flush(bool flushParent = true)
    {
        if (flushParent)
            m_parent->flush();
    }

private:
    Stream::ptr m_parent;
    bool m_own;
};

}

#endif
