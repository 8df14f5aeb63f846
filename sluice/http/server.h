#ifndef __SLUICE_HTTP_SERVER_H__
#define __SLUICE_HTTP_SERVER_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <boost/enable_shared_from_this.hpp>
#include <boost/function.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include "http.h"

namespace Sluice {

class BufferedStream;
class Stream;

namespace HTTP {

class ServerConnection;

/// One request/response exchange on a ServerConnection
///
/// The handler reads the body from requestStream(), fills in response() and
/// writes the body to responseStream(), then calls finish().  Whatever it
/// leaves undone is cleaned up after it returns: an unread request body is
/// drained, and a response whose body came up short closes the connection.
class ServerRequest : public boost::enable_shared_from_this<ServerRequest>,
    boost::noncopyable
{
    friend class ServerConnection;
public:
    typedef boost::shared_ptr<ServerRequest> ptr;

private:
    enum Phase {
        PENDING,
        HEADERS,
        BODY,
        COMPLETE,
        ERROR
    };

    ServerRequest(boost::shared_ptr<ServerConnection> conn,
        unsigned long long number);

public:
    const Request &request() const { return m_request; }
    bool hasRequestBody() const;
    /// The request body with its framing removed; sends 100 Continue first
    /// if the client is waiting for one
    /// @pre hasRequestBody()
    boost::shared_ptr<Stream> requestStream();

    /// Response headers, sent by the first responseStream() or finish()
    Response &response() { return m_response; }
    const Response &response() const { return m_response; }
    bool hasResponseBody() const;
    /// The response body; framed by Content-Length if one was set, else
    /// chunked on HTTP/1.1 or by closing the connection on HTTP/1.0
    boost::shared_ptr<Stream> responseStream();

    bool committed() const { return m_responsePhase >= HEADERS; }
    unsigned long long requestNumber() const { return m_number; }

    /// Give up on this request, and on the connection
    void cancel();
    /// Complete the response and drain the request body
    void finish();

private:
    void serve();
    bool readHeaders();
    bool validate();
    void commit();
    void responseComplete();
    void transportFailed(const char *what);
    bool reusable() const;

private:
    boost::shared_ptr<ServerConnection> m_conn;
    unsigned long long m_number;
    Request m_request;
    Response m_response;
    Phase m_requestPhase, m_responsePhase;
    bool m_close, m_continueSent;
    boost::shared_ptr<Stream> m_requestStream, m_responseStream;
};

/// HTTP/1.x served over one full-duplex Stream
///
/// processRequests() reads requests off the stream one at a time, hands each
/// to the handler, and only reads the next once the previous response is
/// complete.  Persistence follows the request's version and Connection
/// header.  Requests that don't parse, or that use a version or coding this
/// server doesn't speak, are answered without reaching the handler.
class ServerConnection : public boost::enable_shared_from_this<ServerConnection>,
    boost::noncopyable
{
    friend class ServerRequest;
public:
    typedef boost::shared_ptr<ServerConnection> ptr;
    typedef boost::function<void (ServerRequest::ptr)> Handler;

    ServerConnection(boost::shared_ptr<Stream> stream, Handler handler);

    /// Serve requests on the calling Fiber until the connection is done with,
    /// then close the stream
    void processRequests();
    /// Abort the request in progress; processRequests() returns soon after
    void cancel();

    unsigned long long requestCount() const { return m_requestCount; }

private:
    boost::shared_ptr<Stream> bodyStream(const GeneralHeaders &general,
        const EntityHeaders &entity, bool forRead);
    void writeAll(const std::string &text);

private:
    boost::shared_ptr<BufferedStream> m_stream;
    Handler m_handler;
    unsigned long long m_requestCount;
    bool m_cancelled;
};

/// Whether a message carries a body
/// @param status INVALID for a request
/// @param includeEmpty If false, Content-Length: 0 counts as no body
bool hasMessageBody(const GeneralHeaders &general, const EntityHeaders &entity,
    const std::string &method, Status status, bool includeEmpty = true);

/// Respond with a text/plain body of message
/// @pre !request->committed()
void respondError(ServerRequest::ptr request, Status status,
    const std::string &message = std::string(), bool closeConnection = false);

}}

#endif
