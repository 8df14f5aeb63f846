#ifndef __SLUICE_HTTP_CHUNKED_H__
#define __SLUICE_HTTP_CHUNKED_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "sluice/exception.h"
#include "sluice/streams/filter.h"

namespace Sluice {
namespace HTTP {

/// A chunk-size line, or the CRLF after chunk data, was malformed
struct InvalidChunkException : virtual StreamException
{
public:
    InvalidChunkException(const std::string &line) : m_line(line) {}
    ~InvalidChunkException() throw() {}

    const std::string &line() const { return m_line; }

private:
    std::string m_line;
};

/// Transfer-Encoding: chunked over a connection
///
/// Reading decodes the body off a parent that supports find(), through the
/// last chunk and its trailer.  Each write() goes out as one chunk, and
/// close(WRITE) sends the last chunk.  The connection itself is never
/// closed.
class ChunkedStream : public FilterStream
{
public:
    typedef boost::shared_ptr<ChunkedStream> ptr;

    ChunkedStream(Stream::ptr parent);

    void close(CloseType type = BOTH);
    using FilterStream::read;
    size_t read(Buffer &buffer, size_t length);
    using FilterStream::write;
    size_t write(const Buffer &buffer, size_t length);

private:
    enum State {
        SIZE_LINE,
        DATA,
        DATA_END,
        DONE
    };

    std::string line();
    void writeAll(const Buffer &buffer, size_t length);

private:
    State m_state;
    unsigned long long m_left;
    bool m_finished;
};

}}

#endif
