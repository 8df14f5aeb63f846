// Copyright (c) 2026 - Sluice contributors

#include "file_servlet.h"

#include <string.h>

#include <sstream>

#include "sluice/assert.h"
#include "sluice/config.h"
#include "sluice/http/server.h"
#include "sluice/json.h"
#include "sluice/log.h"
#include "sluice/socket.h"
#include "sluice/streams/stream.h"
#include "chunk_scheduler.h"
#include "streaming_responder.h"
#include "upload_receiver.h"

namespace Sluice {

static Logger::ptr g_log = Log::lookup("sluice:files:servlet");

static bool verifyChunkSize(size_t chunkSize)
{
    return chunkSize >= 4096 && chunkSize <= 65536;
}

static ConfigVar<size_t>::ptr
chunkSizeVar()
{
    ConfigVar<size_t>::ptr result = Config::lookup<size_t>("sluice.chunksize",
        65536u,
        "Bytes read from storage, or written to it, per chunk (4096 - 65536)");
    result->beforeChange.connect(&verifyChunkSize);
    return result;
}

static ConfigVar<size_t>::ptr g_chunkSize = chunkSizeVar();

static void
respondJSON(HTTP::ServerRequest::ptr request, HTTP::Status status,
    const JSON::Value &body, bool closeConnection)
{
    std::ostringstream os;
    os << body;
    std::string str = os.str();
    HTTP::Response &response = request->response();
    response.status.status = status;
    if (closeConnection)
        response.general.connection.insert("close");
    response.entity.contentType = HTTP::MediaType("application", "json");
    response.entity.contentLength = str.size();
    if (request->hasResponseBody()) {
        Stream::ptr responseStream = request->responseStream();
        responseStream->write(str.c_str(), str.size());
    }
    request->finish();
}

// No response is possible; the partial upload stays as it is
static void
uploadAborted(HTTP::ServerRequest::ptr request, const std::string &key,
    unsigned long long bytesWritten, const char *why)
{
    SLUICE_LOG_INFO(g_log) << key << " upload aborted after " << bytesWritten
        << " bytes: " << why;
    request->cancel();
}

FileServlet::FileServlet(ChunkSource::ptr source, const std::string &prefix)
: m_source(source),
  m_prefix(prefix)
{
    SLUICE_ASSERT(m_source);
}

size_t
FileServlet::chunkSize()
{
    return g_chunkSize->val();
}

void
FileServlet::request(HTTP::ServerRequest::ptr request)
{
    const std::string &method = request->request().requestLine.method;
    std::string path = HTTP::ServletDispatcher::path(
        request->request().requestLine.uri);
    if (path.compare(0, m_prefix.size(), m_prefix) != 0) {
        HTTP::respondError(request, HTTP::NOT_FOUND, HTTP::reason(HTTP::NOT_FOUND));
        return;
    }
    std::string key = path.substr(m_prefix.size());
    if (!ChunkSource::validKey(key)) {
        SLUICE_LOG_VERBOSE(g_log) << "invalid key '" << key << "'";
        HTTP::respondError(request, HTTP::NOT_FOUND, HTTP::reason(HTTP::NOT_FOUND));
        return;
    }
    if (method == HTTP::GET || method == HTTP::HEAD) {
        download(request, key);
    } else if (method == HTTP::POST) {
        upload(request, key);
    } else {
        std::vector<std::string> &allow = request->response().entity.allow;
        allow.clear();
        allow.push_back(HTTP::GET);
        allow.push_back(HTTP::HEAD);
        allow.push_back(HTTP::POST);
        HTTP::respondError(request, HTTP::METHOD_NOT_ALLOWED,
            HTTP::reason(HTTP::METHOD_NOT_ALLOWED));
    }
}

void
FileServlet::download(HTTP::ServerRequest::ptr request, const std::string &key)
{
    ResourceHandle::ptr handle;
    try {
        handle = m_source->open(key);
    } catch (ResourceNotFoundException &) {
        SLUICE_LOG_VERBOSE(g_log) << key << " not found";
        HTTP::respondError(request, HTTP::NOT_FOUND, HTTP::reason(HTTP::NOT_FOUND));
        return;
    } catch (ChunkReadException &) {
        SLUICE_LOG_ERROR(g_log) << key << " unable to open: "
            << boost::current_exception_diagnostic_information();
        HTTP::respondError(request, HTTP::INTERNAL_SERVER_ERROR,
            HTTP::reason(HTTP::INTERNAL_SERVER_ERROR));
        return;
    }

    const HTTP::RequestHeaders &headers = request->request().request;
    StreamSession session(handle);
    handle.reset();
    try {
        session.resolve(headers.hasRange, headers.range);
    } catch (InvalidRangeException &ex) {
        if (ex.status() == HTTP::REQUESTED_RANGE_NOT_SATISFIABLE) {
            StreamingResponder::prepareUnsatisfiable(ex.length(),
                request->response());
            HTTP::respondError(request, ex.status());
        } else {
            HTTP::respondError(request, ex.status(), HTTP::reason(ex.status()));
        }
        return;
    }

    StreamingResponder::prepare(session, request->response());
    if (!request->hasResponseBody()) {
        // HEAD, or nothing to send
        session.complete();
        request->finish();
        return;
    }
    ChunkScheduler chunks(session, chunkSize());
    StreamSession::State state = StreamingResponder::respond(session, chunks,
        *request->responseStream());
    SLUICE_LOG_VERBOSE(g_log) << key << " " << session.range() << " "
        << state << " after " << chunks.chunksIssued() << " chunks";
    if (state != StreamSession::COMPLETED)
        request->cancel();
}

void
FileServlet::upload(HTTP::ServerRequest::ptr request, const std::string &key)
{
    if (!request->hasRequestBody()) {
        HTTP::respondError(request, HTTP::LENGTH_REQUIRED,
            HTTP::reason(HTTP::LENGTH_REQUIRED));
        return;
    }

    JSON::Value body;
    ResourceHandle::ptr handle;
    try {
        handle = m_source->create(key);
    } catch (ChunkSourceException &ex) {
        SLUICE_LOG_ERROR(g_log) << key << " unable to create: "
            << boost::current_exception_diagnostic_information();
        const int *error = boost::get_error_info<errinfo_nativeerror>(ex);
        body["bytesWritten"] = 0;
        body["error"] = std::string(error ? strerror(*error) : "unable to create");
        respondJSON(request, HTTP::INTERNAL_SERVER_ERROR, body, true);
        return;
    }

    UploadReceiver receiver(chunkSize());
    try {
        receiver.receive(*request->requestStream(), *handle);
    } catch (UploadFailedException &ex) {
        const int *error = boost::get_error_info<errinfo_nativeerror>(ex);
        body["bytesWritten"] = receiver.bytesWritten();
        body["error"] = std::string(error ? strerror(*error) : "write failed");
        respondJSON(request, HTTP::INTERNAL_SERVER_ERROR, body, true);
        return;
    } catch (SocketException &) {
        uploadAborted(request, key, receiver.bytesWritten(),
            "client disconnected");
        return;
    } catch (BrokenPipeException &) {
        uploadAborted(request, key, receiver.bytesWritten(),
            "client disconnected");
        return;
    } catch (OperationAbortedException &) {
        uploadAborted(request, key, receiver.bytesWritten(), "cancelled");
        return;
    } catch (UnexpectedEofException &) {
        uploadAborted(request, key, receiver.bytesWritten(),
            "request body truncated");
        return;
    }
    body["bytesWritten"] = receiver.bytesWritten();
    try {
        handle->close();
    } catch (NativeException &ex) {
        SLUICE_LOG_ERROR(g_log) << key << " unable to close: "
            << boost::current_exception_diagnostic_information();
        const int *error = boost::get_error_info<errinfo_nativeerror>(ex);
        body["error"] = std::string(error ? strerror(*error) : "close failed");
        respondJSON(request, HTTP::INTERNAL_SERVER_ERROR, body, false);
        return;
    }
    respondJSON(request, HTTP::OK, body, false);
}

}
