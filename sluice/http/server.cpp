// Copyright (c) 2009 - Mozy, Inc.

#include "server.h"

#include <strings.h>

#include <sstream>

#include "sluice/assert.h"
#include "sluice/log.h"
#include "sluice/socket.h"
#include "sluice/streams/buffered.h"
#include "sluice/streams/limited.h"
#include "sluice/streams/transfer.h"
#include "chunked.h"
#include "parser.h"

namespace Sluice {
namespace HTTP {

static Logger::ptr g_log = Log::lookup("sluice:http:server");

namespace {
// A body that runs until the connection closes; the connection itself
// outlives it
class UntilCloseStream : public FilterStream
{
public:
    UntilCloseStream(Stream::ptr parent) : FilterStream(parent, false) {}

    using FilterStream::read;
    size_t read(Buffer &buffer, size_t length)
    { return parent()->read(buffer, length); }
    using FilterStream::write;
    size_t write(const Buffer &buffer, size_t length)
    { return parent()->write(buffer, length); }
};
}

static bool
isCoding(const ValueWithParameters &coding, const char *name)
{
    return strcasecmp(coding.value.c_str(), name) == 0;
}

bool
hasMessageBody(const GeneralHeaders &general, const EntityHeaders &entity,
    const std::string &method, Status status, bool includeEmpty)
{
    if (status != INVALID) {
        // RFC 2616 4.3: no body for HEAD, 1xx, 204 or 304
        if (method == HEAD || (status >= 100 && status < 200) ||
            status == NO_CONTENT || status == NOT_MODIFIED)
            return false;
    }
    for (ParameterizedList::const_iterator it = general.transferEncoding.begin();
        it != general.transferEncoding.end(); ++it) {
        if (!isCoding(*it, "identity"))
            return true;
    }
    if (entity.contentLength != ~0ull)
        return entity.contentLength != 0 || includeEmpty;
    // Only a response can be delimited by the connection closing
    return status != INVALID;
}

ServerConnection::ServerConnection(Stream::ptr stream, Handler handler)
: m_stream(new BufferedStream(stream)),
  m_handler(handler),
  m_requestCount(0),
  m_cancelled(false)
{
    SLUICE_ASSERT(m_handler);
}

void
ServerConnection::processRequests()
{
    ServerRequest::ptr request;
    do {
        request.reset(new ServerRequest(shared_from_this(), ++m_requestCount));
        request->serve();
    } while (!m_cancelled && request->reusable());
    SLUICE_LOG_TRACE(g_log) << this << " closing after " << m_requestCount;
    try {
        m_stream->close();
    } catch (OperationAbortedException &) {
        SLUICE_LOG_VERBOSE(g_log) << this << " close aborted";
    } catch (SocketException &) {
        SLUICE_LOG_VERBOSE(g_log) << this << " close failed: "
            << boost::current_exception_diagnostic_information();
    } catch (BrokenPipeException &) {
        SLUICE_LOG_VERBOSE(g_log) << this << " close failed: broken pipe";
    }
}

void
ServerConnection::cancel()
{
    SLUICE_LOG_VERBOSE(g_log) << this << " cancelling";
    m_cancelled = true;
    m_stream->cancelRead();
    m_stream->cancelWrite();
}

Stream::ptr
ServerConnection::bodyStream(const GeneralHeaders &general,
    const EntityHeaders &entity, bool forRead)
{
    // Codings other than identity and chunked were refused already
    for (ParameterizedList::const_iterator it = general.transferEncoding.begin();
        it != general.transferEncoding.end(); ++it) {
        if (isCoding(*it, "chunked"))
            return Stream::ptr(new ChunkedStream(m_stream));
    }
    if (entity.contentLength != ~0ull)
        return Stream::ptr(new LimitedStream(m_stream, entity.contentLength));
    SLUICE_ASSERT(!forRead);
    return Stream::ptr(new UntilCloseStream(m_stream));
}

void
ServerConnection::writeAll(const std::string &text)
{
    m_stream->write(text.c_str(), text.size());
}


ServerRequest::ServerRequest(ServerConnection::ptr conn,
    unsigned long long number)
: m_conn(conn),
  m_number(number),
  m_requestPhase(HEADERS),
  m_responsePhase(PENDING),
  m_close(false),
  m_continueSent(false)
{}

bool
ServerRequest::hasRequestBody() const
{
    return m_requestStream || hasMessageBody(m_request.general,
        m_request.entity, m_request.requestLine.method, INVALID);
}

Stream::ptr
ServerRequest::requestStream()
{
    if (m_requestStream)
        return m_requestStream;
    const StringSet &expect = m_request.request.expect;
    if (!m_continueSent && !committed() &&
        m_request.requestLine.ver >= Version(1, 1) &&
        expect.find("100-continue") != expect.end()) {
        SLUICE_LOG_TRACE(g_log) << m_conn << "-" << m_number
            << " 100 Continue";
        m_continueSent = true;
        std::ostringstream os;
        os << m_request.requestLine.ver << " 100 Continue\r\n\r\n";
        m_conn->writeAll(os.str());
        m_conn->m_stream->flush();
    }
    m_requestStream = m_conn->bodyStream(m_request.general, m_request.entity,
        true);
    return m_requestStream;
}

bool
ServerRequest::hasResponseBody() const
{
    return m_responseStream || hasMessageBody(m_response.general,
        m_response.entity, m_request.requestLine.method,
        m_response.status.status, false);
}

Stream::ptr
ServerRequest::responseStream()
{
    if (!m_responseStream) {
        commit();
        SLUICE_ASSERT(m_responsePhase == BODY);
        m_responseStream = m_conn->bodyStream(m_response.general,
            m_response.entity, false);
    }
    return m_responseStream;
}

void
ServerRequest::cancel()
{
    if (m_requestPhase >= COMPLETE && m_responsePhase >= COMPLETE)
        return;
    SLUICE_LOG_TRACE(g_log) << m_conn << "-" << m_number << " aborting";
    if (m_requestPhase < COMPLETE)
        m_requestPhase = ERROR;
    if (m_responsePhase < COMPLETE)
        m_responsePhase = ERROR;
    m_close = true;
    m_conn->m_stream->cancelRead();
    m_conn->m_stream->cancelWrite();
}

void
ServerRequest::finish()
{
    if (m_responsePhase == ERROR)
        return;
    if (m_responsePhase < COMPLETE) {
        commit();
        if (m_responsePhase == BODY) {
            LimitedStream::ptr limited =
                boost::dynamic_pointer_cast<LimitedStream>(m_responseStream);
            if (!m_responseStream ||
                (limited && limited->position() != limited->size())) {
                SLUICE_LOG_VERBOSE(g_log) << m_conn << "-" << m_number
                    << " response body short";
                cancel();
                return;
            }
            // The last chunk, when chunked
            m_responseStream->close(Stream::WRITE);
            responseComplete();
        }
    }
    if (m_requestPhase != BODY)
        return;
    // A client still waiting on 100 Continue won't send the body, so it
    // can't be drained
    const StringSet &expect = m_request.request.expect;
    if (!m_continueSent && expect.find("100-continue") != expect.end())
        m_close = true;
    if (m_close)
        return;
    drainStream(*requestStream());
    m_requestPhase = COMPLETE;
}

bool
ServerRequest::reusable() const
{
    return !m_close && m_requestPhase == COMPLETE &&
        m_responsePhase == COMPLETE;
}

bool
ServerRequest::readHeaders()
{
    RequestParser parser(m_request);
    try {
        if (parser.run(*m_conn->m_stream) == 0 && !parser.error() &&
            !parser.complete()) {
            SLUICE_LOG_TRACE(g_log) << m_conn << "-" << m_number << " EOF";
            m_close = true;
            return false;
        }
    } catch (IncompleteMessageHeaderException &) {
        transportFailed("closed mid-header");
        return false;
    } catch (OperationAbortedException &) {
        transportFailed("aborted");
        return false;
    } catch (SocketException &) {
        // Includes the idle read timeout
        transportFailed("socket error");
        return false;
    } catch (BrokenPipeException &) {
        transportFailed("broken pipe");
        return false;
    }
    if (parser.error() || !parser.complete()) {
        m_requestPhase = ERROR;
        respondError(shared_from_this(), BAD_REQUEST,
            "Unable to parse request.", true);
        return false;
    }
    if (g_log->enabled(Log::DEBUG)) {
        SLUICE_LOG_DEBUG(g_log) << m_conn << "-" << m_number << " "
            << m_request;
    } else {
        SLUICE_LOG_VERBOSE(g_log) << m_conn << "-" << m_number << " "
            << m_request.requestLine;
    }
    return true;
}

// Refuses what this server can't honor; on false a response has gone out
bool
ServerRequest::validate()
{
    const Version &ver = m_request.requestLine.ver;
    Status refusal = OK;
    std::string why;
    ParameterizedList &codings = m_request.general.transferEncoding;
    for (ParameterizedList::iterator it = codings.begin(); it != codings.end();) {
        if (isCoding(*it, "identity"))
            it = codings.erase(it);
        else
            ++it;
    }
    if (ver.major != 1) {
        refusal = HTTP_VERSION_NOT_SUPPORTED;
    } else if (ver >= Version(1, 1) && m_request.request.host.empty()) {
        refusal = BAD_REQUEST;
        why = "Host header is required with HTTP/1.1";
    } else if (!codings.empty() && !isCoding(codings.back(), "chunked")) {
        refusal = BAD_REQUEST;
        why = "The last transfer-coding is not chunked.";
    } else if (!codings.empty() && !codings.back().parameters.empty()) {
        refusal = NOT_IMPLEMENTED;
        why = "Unknown parameter to chunked transfer-coding.";
    } else if (codings.size() > 1) {
        const ValueWithParameters &first = codings.front();
        refusal = isCoding(first, "chunked") ? BAD_REQUEST : NOT_IMPLEMENTED;
        why = isCoding(first, "chunked") ?
            "chunked transfer-coding applied multiple times." :
            "Unsupported transfer-coding: " + first.value;
    }
    const StringSet &expect = m_request.request.expect;
    for (StringSet::const_iterator it = expect.begin();
        refusal == OK && it != expect.end(); ++it) {
        if (strcasecmp(it->c_str(), "100-continue") != 0) {
            refusal = EXPECTATION_FAILED;
            why = "Unrecognized expectation: " + *it;
        }
    }
    if (refusal != OK) {
        m_requestPhase = ERROR;
        respondError(shared_from_this(), refusal, why, true);
        return false;
    }

    const StringSet &connection = m_request.general.connection;
    if (connection.find("close") != connection.end() ||
        (ver == Version(1, 0) &&
        connection.find("Keep-Alive") == connection.end()))
        m_close = true;
    return true;
}

void
ServerRequest::transportFailed(const char *what)
{
    SLUICE_LOG_VERBOSE(g_log) << m_conn << "-" << m_number << " " << what
        << ": " << boost::current_exception_diagnostic_information();
    cancel();
}

void
ServerRequest::serve()
{
    try {
        if (!readHeaders() || !validate())
            return;
        m_requestPhase = hasMessageBody(m_request.general, m_request.entity,
            m_request.requestLine.method, INVALID, false) ? BODY : COMPLETE;
        m_conn->m_handler(shared_from_this());
        finish();
    } catch (OperationAbortedException &) {
        transportFailed("aborted");
    } catch (SocketException &) {
        transportFailed("client disconnected");
    } catch (BrokenPipeException &) {
        transportFailed("client disconnected");
    } catch (UnexpectedEofException &) {
        transportFailed("request body truncated");
    } catch (InvalidChunkException &ex) {
        SLUICE_LOG_INFO(g_log) << m_conn << "-" << m_number
            << " invalid chunk: " << ex.line();
        m_requestPhase = ERROR;
        if (committed())
            cancel();
        else
            respondError(shared_from_this(), BAD_REQUEST, "Invalid chunk.",
                true);
    } catch (Assertion &) {
        throw;
    } catch (std::exception &) {
        SLUICE_LOG_ERROR(g_log) << m_conn << "-" << m_number
            << " handler failed: "
            << boost::current_exception_diagnostic_information();
        if (m_responsePhase >= COMPLETE) {
            m_close = true;
            return;
        }
        if (committed() || m_responsePhase == ERROR) {
            cancel();
            return;
        }
        m_requestPhase = ERROR;
        try {
            respondError(shared_from_this(), INTERNAL_SERVER_ERROR,
                reason(INTERNAL_SERVER_ERROR), true);
        } catch (std::exception &) {
            transportFailed("500 failed");
        }
    }
}

void
ServerRequest::commit()
{
    if (m_responsePhase != PENDING)
        return;

    GeneralHeaders &general = m_response.general;
    StatusLine &status = m_response.status;
    if (general.connection.find("close") != general.connection.end())
        m_close = true;
    if (status.ver == Version())
        status.ver = m_request.requestLine.ver == Version(1, 0) ?
            Version(1, 0) : Version(1, 1);
    SLUICE_ASSERT(status.ver == Version(1, 0) || status.ver == Version(1, 1));
    SLUICE_ASSERT(status.status != INVALID);

    // An undelimited body is chunked on 1.1, and ends the connection on 1.0
    if (m_response.entity.contentLength == ~0ull &&
        general.transferEncoding.empty()) {
        if (status.ver == Version(1, 1))
            general.transferEncoding.push_back("chunked");
        else
            m_close = true;
    }
    SLUICE_ASSERT(general.transferEncoding.empty() ||
        (general.transferEncoding.size() == 1 &&
        isCoding(general.transferEncoding.front(), "chunked") &&
        status.ver == Version(1, 1)));

    if (m_close)
        general.connection.insert("close");
    else if (status.ver == Version(1, 0))
        general.connection.insert("Keep-Alive");
    if (status.reason.empty())
        status.reason = reason(status.status);
    if (general.date.is_not_a_date_time())
        general.date = boost::posix_time::second_clock::universal_time();

    m_responsePhase = HEADERS;
    std::ostringstream os;
    os << m_response;
    if (g_log->enabled(Log::DEBUG)) {
        SLUICE_LOG_DEBUG(g_log) << m_conn << "-" << m_number << " "
            << os.str();
    } else {
        SLUICE_LOG_VERBOSE(g_log) << m_conn << "-" << m_number << " "
            << status;
    }
    try {
        m_conn->writeAll(os.str());
    } catch (std::exception &) {
        m_responsePhase = ERROR;
        m_close = true;
        throw;
    }
    if (hasMessageBody(general, m_response.entity,
        m_request.requestLine.method, status.status, false))
        m_responsePhase = BODY;
    else
        responseComplete();
}

void
ServerRequest::responseComplete()
{
    m_responseStream.reset();
    m_conn->m_stream->flush();
    m_responsePhase = COMPLETE;
    SLUICE_LOG_INFO(g_log) << m_conn << "-" << m_number << " "
        << m_request.requestLine << " " << m_response.status.status;
}


void
respondError(ServerRequest::ptr request, Status status,
    const std::string &message, bool closeConnection)
{
    SLUICE_ASSERT(!request->committed());
    Response &response = request->response();
    response.status.status = status;
    if (closeConnection)
        response.general.connection.insert("close");
    response.general.transferEncoding.clear();
    response.entity.contentLength = message.size();
    response.entity.contentType = message.empty() ? MediaType() :
        MediaType("text", "plain");
    if (request->hasResponseBody())
        request->responseStream()->write(message.c_str(), message.size());
    request->finish();
}

}}
