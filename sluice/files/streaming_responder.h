#ifndef __SLUICE_FILES_STREAMING_RESPONDER_H__
#define __SLUICE_FILES_STREAMING_RESPONDER_H__
// Copyright (c) 2026 - Sluice contributors

#include "session.h"

namespace Sluice {

class ChunkScheduler;
class Stream;

namespace HTTP {
struct Response;
}

struct StreamingResponder
{
    /// Fill in status and entity headers for the session's resolved range
    /// @pre session.state() == StreamSession::RANGE_PARSED
    static void prepare(const StreamSession &session, HTTP::Response &response);
    /// Headers of a 416 for a resource of the given length
    static void prepareUnsatisfiable(unsigned long long length,
        HTTP::Response &response);

    /// Write every chunk to transport, one at a time
    ///
    /// Each chunk is flushed completely before the next one is pulled, so a
    /// transport that stops accepting data stops the reads.  Transport
    /// failures and cancellation end the session CANCELLED; storage failures
    /// and a resource that comes up short end it FAILED.  Neither is thrown,
    /// since the headers are already out.
    /// @return The terminal state of the session
    static StreamSession::State respond(StreamSession &session,
        ChunkScheduler &chunks, Stream &transport);
};

}

#endif
