// Copyright (c) 2026 - Sluice contributors

#include "streaming_responder.h"

#include "sluice/assert.h"
#include "sluice/http/http.h"
#include "sluice/log.h"
#include "sluice/socket.h"
#include "sluice/streams/stream.h"
#include "chunk_scheduler.h"

namespace Sluice {

static Logger::ptr g_log = Log::lookup("sluice:files:responder");

void
StreamingResponder::prepare(const StreamSession &session,
    HTTP::Response &response)
{
    SLUICE_ASSERT(session.state() == StreamSession::RANGE_PARSED);
    const ResolvedRange &range = session.range();
    const Resource &resource = session.resource();
    response.status.status = range.status;
    response.response.acceptRanges.insert("bytes");
    response.entity.contentLength = range.length;
    if (range.partial())
        response.entity.contentRange = HTTP::ContentRange(range.start,
            range.end(), range.total);
    response.entity.contentType = HTTP::MediaType("application", "octet-stream");
    if (!resource.contentType.empty()) {
        size_t slash = resource.contentType.find('/');
        if (slash != std::string::npos)
            response.entity.contentType = HTTP::MediaType(
                resource.contentType.substr(0, slash),
                resource.contentType.substr(slash + 1));
    }
    response.entity.lastModified = resource.lastModified;
}

void
StreamingResponder::prepareUnsatisfiable(unsigned long long length,
    HTTP::Response &response)
{
    response.status.status = HTTP::REQUESTED_RANGE_NOT_SATISFIABLE;
    response.response.acceptRanges.insert("bytes");
    response.entity.contentRange = HTTP::ContentRange(~0ull, ~0ull, length);
}

StreamSession::State
StreamingResponder::respond(StreamSession &session, ChunkScheduler &chunks,
    Stream &transport)
{
    SLUICE_ASSERT(session.state() == StreamSession::RANGE_PARSED);
    Chunk chunk;
    try {
        while (!session.terminal() && chunks.next(chunk)) {
            if (session.state() == StreamSession::RANGE_PARSED)
                session.startStreaming();
            while (chunk.data.readAvailable() > 0) {
                size_t written = transport.write(chunk.data,
                    chunk.data.readAvailable());
                chunk.data.consume(written);
            }
            // Don't pull the next chunk until this one is on the wire
            transport.flush();
        }
    } catch (TimedOutException &) {
        SLUICE_LOG_INFO(g_log) << &session << " " << session.resource().key
            << " timed out at " << session.cursor();
        session.cancel();
    } catch (SocketException &) {
        SLUICE_LOG_INFO(g_log) << &session << " " << session.resource().key
            << " client disconnected at " << session.cursor();
        session.cancel();
    } catch (BrokenPipeException &) {
        SLUICE_LOG_INFO(g_log) << &session << " " << session.resource().key
            << " client disconnected at " << session.cursor();
        session.cancel();
    } catch (OperationAbortedException &) {
        SLUICE_LOG_INFO(g_log) << &session << " " << session.resource().key
            << " cancelled at " << session.cursor();
        session.cancel();
    } catch (ChunkSourceException &) {
        SLUICE_LOG_ERROR(g_log) << &session << " " << session.resource().key
            << " read failed: "
            << boost::current_exception_diagnostic_information();
        session.fail();
    } catch (NativeException &) {
        SLUICE_LOG_ERROR(g_log) << &session << " " << session.resource().key
            << " transport failed at " << session.cursor() << ": "
            << boost::current_exception_diagnostic_information();
        session.fail();
    } catch (StreamException &) {
        SLUICE_LOG_ERROR(g_log) << &session << " " << session.resource().key
            << " transport failed at " << session.cursor() << ": "
            << boost::current_exception_diagnostic_information();
        session.fail();
    }
    if (session.terminal())
        return session.state();
    if (session.remaining() != 0) {
        SLUICE_LOG_ERROR(g_log) << &session << " " << session.resource().key
            << " ended at " << session.cursor() << ", short of "
            << session.range().end() + 1;
        session.fail();
        return session.state();
    }
    session.complete();
    return session.state();
}

}
