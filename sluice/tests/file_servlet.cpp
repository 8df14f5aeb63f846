// Copyright (c) 2026 - Sluice contributors

#include <errno.h>
#include <stdlib.h>
#include <unistd.h>

#include <fstream>
#include <iterator>

#include <boost/bind.hpp>

#include "sluice/files/file_servlet.h"
#include "sluice/http/chunked.h"
#include "sluice/http/parser.h"
#include "sluice/http/server.h"
#include "sluice/streams/buffered.h"
#include "sluice/streams/memory.h"
#include "sluice/streams/transfer.h"
#include "sluice/test/test.h"
#include "sluice/workerpool.h"

using namespace Sluice;
using namespace Sluice::HTTP;
using namespace Sluice::Test;

namespace {
class ServletFixture
{
public:
    ServletFixture()
    {
        char dir[] = "/tmp/sluice_file_servlet_XXXXXX";
        SLUICE_TEST_ASSERT(mkdtemp(dir));
        m_root = dir;
        m_dispatcher.reset(new ServletDispatcher());
        m_dispatcher->registerServlet("/files/", Servlet::ptr(
            new FileServlet(ChunkSource::ptr(new FileChunkSource(m_root)))));
    }
    ~ServletFixture()
    {
        for (std::vector<std::string>::const_iterator it(m_files.begin());
            it != m_files.end();
            ++it)
            unlink((m_root + "/" + *it).c_str());
        rmdir(m_root.c_str());
    }

    // '0' .. '9', repeating
    std::string file(const std::string &name, size_t length)
    {
        std::string contents;
        contents.reserve(length);
        for (size_t i = 0; i < length; ++i)
            contents.append(1, (char)('0' + i % 10));
        std::ofstream os((m_root + "/" + name).c_str(), std::ios::binary);
        os << contents;
        m_files.push_back(name);
        return contents;
    }

    std::string contents(const std::string &name)
    {
        std::ifstream is((m_root + "/" + name).c_str(), std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(is),
            std::istreambuf_iterator<char>());
    }

    void created(const std::string &name) { m_files.push_back(name); }

    Stream::ptr serve(const std::string &requests)
    {
        MemoryStream::ptr stream(new MemoryStream(Buffer(requests)));
        ServerConnection::ptr conn(new ServerConnection(stream,
            boost::bind(&Servlet::request, m_dispatcher, _1)));
        WorkerPool pool;
        pool.schedule(boost::bind(&ServerConnection::processRequests, conn));
        pool.dispatch();
        return Stream::ptr(new BufferedStream(Stream::ptr(
            new MemoryStream(stream->written()))));
    }

    static bool readResponse(Stream::ptr stream, Response &response,
        std::string &body, bool head = false)
    {
        response = Response();
        body.clear();
        ResponseParser parser(response);
        if (parser.run(*stream) == 0)
            return false;
        SLUICE_TEST_ASSERT(parser.complete());
        SLUICE_TEST_ASSERT(!parser.error());
        if (head)
            return true;
        MemoryStream bodyStream;
        if (!response.general.transferEncoding.empty()) {
            ChunkedStream chunked(stream);
            transferStream(chunked, bodyStream);
        } else if (response.entity.contentLength != ~0ull) {
            transferStream(*stream, bodyStream, response.entity.contentLength);
        } else {
            transferStream(*stream, bodyStream);
        }
        body = bodyStream.written().toString();
        return true;
    }

    void request(const std::string &request, Response &response,
        std::string &body, bool head = false)
    {
        Stream::ptr stream = serve(request);
        SLUICE_TEST_ASSERT(readResponse(stream, response, body, head));
    }

    static std::string get(const std::string &uri,
        const std::string &extraHeaders = std::string())
    {
        return "GET " + uri + " HTTP/1.1\r\n"
            "Host: localhost\r\n"
            "Connection: close\r\n" + extraHeaders + "\r\n";
    }

protected:
    std::string m_root;
    std::vector<std::string> m_files;
    ServletDispatcher::ptr m_dispatcher;
};

bool hasClose(const Response &response)
{
    return response.general.connection.find("close") !=
        response.general.connection.end();
}

class FullHandle : public ResourceHandle
{
public:
    FullHandle(const std::string &key, unsigned long long capacity)
        : m_capacity(capacity)
    {
        m_resource.key = key;
    }

    const Resource &resource() const { return m_resource; }

    size_t readAt(unsigned long long offset, Buffer &buffer, size_t maxLength)
    {
        SLUICE_NOTREACHED();
    }

    void writeAt(unsigned long long offset, const Buffer &buffer)
    {
        if (offset + buffer.readAvailable() > m_capacity)
            SLUICE_THROW_EXCEPTION(ChunkWriteException()
                << errinfo_resource(m_resource.key)
                << errinfo_offset(offset)
                << errinfo_nativeerror(ENOSPC)
                << boost::errinfo_api_function("pwrite"));
        m_resource.length = offset + buffer.readAvailable();
    }

    void close() {}

private:
    Resource m_resource;
    unsigned long long m_capacity;
};

// Every upload runs out of space after capacity bytes
class FullSource : public ChunkSource
{
public:
    FullSource(unsigned long long capacity) : m_capacity(capacity) {}

    ResourceHandle::ptr open(const std::string &key)
    {
        SLUICE_THROW_EXCEPTION(ResourceNotFoundException()
            << errinfo_resource(key));
    }

    ResourceHandle::ptr create(const std::string &key)
    {
        return ResourceHandle::ptr(new FullHandle(key, m_capacity));
    }

private:
    unsigned long long m_capacity;
};
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, wholeResource)
{
    std::string data = file("abc", 500);
    Response response;
    std::string body;
    request(get("/files/abc"), response, body);
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, OK);
    SLUICE_TEST_ASSERT_EQUAL(response.entity.contentLength, 500u);
    SLUICE_TEST_ASSERT_EQUAL(response.entity.contentRange, ContentRange());
    SLUICE_TEST_ASSERT(response.response.acceptRanges.find("bytes") !=
        response.response.acceptRanges.end());
    SLUICE_TEST_ASSERT_EQUAL(response.entity.contentType.type, "application");
    SLUICE_TEST_ASSERT_EQUAL(response.entity.contentType.subtype, "octet-stream");
    SLUICE_TEST_ASSERT(!response.entity.lastModified.is_not_a_date_time());
    SLUICE_TEST_ASSERT(body == data);
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, manyChunks)
{
    std::string data = file("big", 300000);
    Response response;
    std::string body;
    request(get("/files/big"), response, body);
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, OK);
    SLUICE_TEST_ASSERT_EQUAL(response.entity.contentLength, 300000u);
    SLUICE_TEST_ASSERT(body == data);
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, partial)
{
    std::string data = file("abc", 10000);
    Response response;
    std::string body;
    request(get("/files/abc", "Range: bytes=500-1499\r\n"), response, body);
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, PARTIAL_CONTENT);
    SLUICE_TEST_ASSERT_EQUAL(response.entity.contentLength, 1000u);
    SLUICE_TEST_ASSERT_EQUAL(response.entity.contentRange,
        ContentRange(500, 1499, 10000));
    SLUICE_TEST_ASSERT(body == data.substr(500, 1000));
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, lastByte)
{
    std::string data = file("abc", 10000);
    Response response;
    std::string body;
    request(get("/files/abc", "Range: bytes=9999-\r\n"), response, body);
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, PARTIAL_CONTENT);
    SLUICE_TEST_ASSERT_EQUAL(response.entity.contentLength, 1u);
    SLUICE_TEST_ASSERT_EQUAL(response.entity.contentRange,
        ContentRange(9999, 9999, 10000));
    SLUICE_TEST_ASSERT_EQUAL(body, "9");
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, suffix)
{
    std::string data = file("abc", 10000);
    Response response;
    std::string body;
    request(get("/files/abc", "Range: bytes=-20000\r\n"), response, body);
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, PARTIAL_CONTENT);
    SLUICE_TEST_ASSERT_EQUAL(response.entity.contentRange,
        ContentRange(0, 9999, 10000));
    SLUICE_TEST_ASSERT(body == data);
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, unsatisfiable)
{
    file("abc", 10000);
    Response response;
    std::string body;
    request(get("/files/abc", "Range: bytes=10000-20000\r\n"), response, body);
    SLUICE_TEST_ASSERT_EQUAL(response.status.status,
        REQUESTED_RANGE_NOT_SATISFIABLE);
    SLUICE_TEST_ASSERT_EQUAL(response.entity.contentRange,
        ContentRange(~0ull, ~0ull, 10000));
    SLUICE_TEST_ASSERT_EQUAL(response.entity.contentLength, 0u);
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, multipleRanges)
{
    file("abc", 10000);
    Response response;
    std::string body;
    request(get("/files/abc", "Range: bytes=0-1,5-6\r\n"), response, body);
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, BAD_REQUEST);
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, malformedRange)
{
    file("abc", 10000);
    Response response;
    std::string body;
    request(get("/files/abc", "Range: bytes=-0\r\n"), response, body);
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, BAD_REQUEST);
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, emptyResource)
{
    file("empty", 0);
    Response response;
    std::string body;
    request(get("/files/empty"), response, body);
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, OK);
    SLUICE_TEST_ASSERT_EQUAL(response.entity.contentLength, 0u);
    SLUICE_TEST_ASSERT_EQUAL(body, "");

    request(get("/files/empty", "Range: bytes=0-\r\n"), response, body);
    SLUICE_TEST_ASSERT_EQUAL(response.status.status,
        REQUESTED_RANGE_NOT_SATISFIABLE);
    SLUICE_TEST_ASSERT_EQUAL(response.entity.contentRange,
        ContentRange(~0ull, ~0ull, 0));
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, headPartial)
{
    file("abc", 10000);
    Response response;
    std::string body;
    request(
        "HEAD /files/abc HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Range: bytes=500-1499\r\n"
        "\r\n"
        "GET /files/abc HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Range: bytes=500-1499\r\n"
        "Connection: close\r\n"
        "\r\n",
        response, body, true);
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, PARTIAL_CONTENT);
    SLUICE_TEST_ASSERT_EQUAL(response.entity.contentLength, 1000u);
    SLUICE_TEST_ASSERT_EQUAL(response.entity.contentRange,
        ContentRange(500, 1499, 10000));
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, headThenGet)
{
    std::string data = file("abc", 10000);
    Stream::ptr stream = serve(
        "HEAD /files/abc HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "\r\n"
        "GET /files/abc HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Connection: close\r\n"
        "\r\n");
    Response head, get;
    std::string body;
    SLUICE_TEST_ASSERT(readResponse(stream, head, body, true));
    SLUICE_TEST_ASSERT(readResponse(stream, get, body));
    SLUICE_TEST_ASSERT_EQUAL(head.status.status, get.status.status);
    SLUICE_TEST_ASSERT_EQUAL(head.entity.contentLength,
        get.entity.contentLength);
    SLUICE_TEST_ASSERT(body == data);
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, sameRangeTwice)
{
    std::string data = file("abc", 10000);
    Stream::ptr stream = serve(
        "GET /files/abc HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Range: bytes=1234-5678\r\n"
        "\r\n"
        "GET /files/abc HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Range: bytes=1234-5678\r\n"
        "Connection: close\r\n"
        "\r\n");
    Response first, second;
    std::string firstBody, secondBody;
    SLUICE_TEST_ASSERT(readResponse(stream, first, firstBody));
    SLUICE_TEST_ASSERT(readResponse(stream, second, secondBody));
    SLUICE_TEST_ASSERT_EQUAL(first.status.status, PARTIAL_CONTENT);
    SLUICE_TEST_ASSERT_EQUAL(second.status.status, PARTIAL_CONTENT);
    SLUICE_TEST_ASSERT_EQUAL(first.entity.contentRange,
        second.entity.contentRange);
    SLUICE_TEST_ASSERT(firstBody == data.substr(1234, 4445));
    SLUICE_TEST_ASSERT(firstBody == secondBody);
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, notFound)
{
    Response response;
    std::string body;
    request(get("/files/missing"), response, body);
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, NOT_FOUND);
    SLUICE_TEST_ASSERT_EQUAL(body, "Not Found");

    request(get("/files/..%2Fetc%2Fpasswd"), response, body);
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, NOT_FOUND);

    request(get("/elsewhere"), response, body);
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, NOT_FOUND);
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, queryIgnored)
{
    std::string data = file("abc", 100);
    Response response;
    std::string body;
    request(get("/files/abc?version=2"), response, body);
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, OK);
    SLUICE_TEST_ASSERT(body == data);
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, methodNotAllowed)
{
    file("abc", 100);
    Response response;
    std::string body;
    request(
        "PUT /files/abc HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length: 0\r\n"
        "Connection: close\r\n"
        "\r\n",
        response, body);
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, METHOD_NOT_ALLOWED);
    SLUICE_TEST_ASSERT_EQUAL(response.entity.allow.size(), 3u);
    SLUICE_TEST_ASSERT_EQUAL(response.entity.allow[0], "GET");
    SLUICE_TEST_ASSERT_EQUAL(response.entity.allow[1], "HEAD");
    SLUICE_TEST_ASSERT_EQUAL(response.entity.allow[2], "POST");
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, upload)
{
    Response response;
    std::string body;
    request(
        "POST /files/uploaded HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length: 5\r\n"
        "Connection: close\r\n"
        "\r\n"
        "hello",
        response, body);
    created("uploaded");
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, OK);
    SLUICE_TEST_ASSERT_EQUAL(response.entity.contentType.type, "application");
    SLUICE_TEST_ASSERT_EQUAL(response.entity.contentType.subtype, "json");
    SLUICE_TEST_ASSERT_EQUAL(body, "{\"bytesWritten\": 5}");
    SLUICE_TEST_ASSERT_EQUAL(contents("uploaded"), "hello");
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, uploadChunked)
{
    Response response;
    std::string body;
    request(
        "POST /files/uploaded HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Transfer-Encoding: chunked\r\n"
        "Connection: close\r\n"
        "\r\n"
        "5\r\n"
        "hello\r\n"
        "6\r\n"
        " world\r\n"
        "0\r\n"
        "\r\n",
        response, body);
    created("uploaded");
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, OK);
    SLUICE_TEST_ASSERT_EQUAL(body, "{\"bytesWritten\": 11}");
    SLUICE_TEST_ASSERT_EQUAL(contents("uploaded"), "hello world");
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, uploadReplaces)
{
    file("abc", 10000);
    Response response;
    std::string body;
    request(
        "POST /files/abc HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length: 3\r\n"
        "Connection: close\r\n"
        "\r\n"
        "xyz",
        response, body);
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, OK);
    SLUICE_TEST_ASSERT_EQUAL(contents("abc"), "xyz");
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, uploadThenDownload)
{
    Stream::ptr stream = serve(
        "POST /files/roundtrip HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length: 10\r\n"
        "\r\n"
        "0123456789"
        "GET /files/roundtrip HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Range: bytes=3-5\r\n"
        "Connection: close\r\n"
        "\r\n");
    created("roundtrip");
    Response response;
    std::string body;
    SLUICE_TEST_ASSERT(readResponse(stream, response, body));
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, OK);
    SLUICE_TEST_ASSERT(!hasClose(response));
    SLUICE_TEST_ASSERT(readResponse(stream, response, body));
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, PARTIAL_CONTENT);
    SLUICE_TEST_ASSERT_EQUAL(body, "345");
}

SLUICE_UNITTEST_FIXTURE(ServletFixture, FileServlet, uploadWithoutLength)
{
    Response response;
    std::string body;
    request(
        "POST /files/uploaded HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Connection: close\r\n"
        "\r\n",
        response, body);
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, LENGTH_REQUIRED);
    SLUICE_TEST_ASSERT_EQUAL(access((m_root + "/uploaded").c_str(), F_OK), -1);
}

SLUICE_UNITTEST(FileServlet, uploadFailure)
{
    ServletDispatcher::ptr dispatcher(new ServletDispatcher());
    dispatcher->registerServlet("/files/", Servlet::ptr(
        new FileServlet(ChunkSource::ptr(new FullSource(70000)))));
    std::string requests =
        "POST /files/full HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length: 100000\r\n"
        "\r\n" + std::string(100000, 'x') +
        "GET /files/ignored HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "\r\n";
    MemoryStream::ptr stream(new MemoryStream(Buffer(requests)));
    ServerConnection::ptr conn(new ServerConnection(stream,
        boost::bind(&Servlet::request, dispatcher, _1)));
    WorkerPool pool;
    pool.schedule(boost::bind(&ServerConnection::processRequests, conn));
    pool.dispatch();

    Stream::ptr responses(new BufferedStream(Stream::ptr(
        new MemoryStream(stream->written()))));
    Response response;
    std::string body;
    SLUICE_TEST_ASSERT(ServletFixture::readResponse(responses, response, body));
    SLUICE_TEST_ASSERT_EQUAL(response.status.status, INTERNAL_SERVER_ERROR);
    SLUICE_TEST_ASSERT(hasClose(response));
    SLUICE_TEST_ASSERT_EQUAL(body,
        "{\"bytesWritten\": 65536, \"error\": \"No space left on device\"}");
    SLUICE_TEST_ASSERT(!ServletFixture::readResponse(responses, response, body));
    SLUICE_TEST_ASSERT_EQUAL(conn->requestCount(), 1u);
}
