// Copyright (c) 2009 - Mozy, Inc.

#include "chunked.h"

#include <stdlib.h>

#include <algorithm>
#include <sstream>

#include "sluice/log.h"
#include "sluice/string.h"

namespace Sluice {
namespace HTTP {

static Logger::ptr g_log = Log::lookup("sluice:http:chunked");

ChunkedStream::ChunkedStream(Stream::ptr parent)
: FilterStream(parent, false),
  m_state(SIZE_LINE),
  m_left(0),
  m_finished(false)
{}

void
ChunkedStream::close(CloseType type)
{
    if ((type & WRITE) && !m_finished) {
        SLUICE_LOG_VERBOSE(g_log) << this << " last chunk";
        m_finished = true;
        writeAll(Buffer("0\r\n\r\n"), 5);
    }
}

// Bare LF is tolerated as a line ending
std::string
ChunkedStream::line()
{
    std::string result = parent()->getDelimited('\n');
    if (!result.empty() && result[result.size() - 1] == '\r')
        result.resize(result.size() - 1);
    return result;
}

size_t
ChunkedStream::read(Buffer &buffer, size_t length)
{
    while (m_state != DATA) {
        switch (m_state) {
            case SIZE_LINE:
            {
                std::string sizeLine = line();
                // Extensions after ';' carry nothing we use
                std::string hex = trim(sizeLine.substr(0, sizeLine.find(';')));
                char *end;
                m_left = strtoull(hex.c_str(), &end, 16);
                if (hex.empty() || *end != '\0' || m_left == ~0ull)
                    SLUICE_THROW_EXCEPTION(InvalidChunkException(sizeLine));
                SLUICE_LOG_DEBUG(g_log) << this << " chunk of " << m_left;
                if (m_left != 0) {
                    m_state = DATA;
                    break;
                }
                // Trailer fields run to an empty line
                while (!line().empty());
                m_state = DONE;
                break;
            }
            case DATA_END:
            {
                std::string rest = line();
                if (!rest.empty())
                    SLUICE_THROW_EXCEPTION(InvalidChunkException(rest));
                m_state = SIZE_LINE;
                break;
            }
            case DONE:
                return 0;
            default:
                SLUICE_NOTREACHED();
        }
    }
    size_t want = (size_t)std::min<unsigned long long>(length, m_left);
    size_t result = parent()->read(buffer, want);
    if (result == 0)
        SLUICE_THROW_EXCEPTION(UnexpectedEofException());
    m_left -= result;
    if (m_left == 0)
        m_state = DATA_END;
    return result;
}

void
ChunkedStream::writeAll(const Buffer &buffer, size_t length)
{
    Buffer rest;
    rest.copyIn(buffer, length);
    while (rest.readAvailable() > 0)
        rest.consume(parent()->write(rest, rest.readAvailable()));
}

size_t
ChunkedStream::write(const Buffer &buffer, size_t length)
{
    SLUICE_ASSERT(!m_finished);
    length = std::min(length, buffer.readAvailable());
    if (length == 0)
        return 0;
    std::ostringstream os;
    os << std::hex << length << "\r\n";
    Buffer frame(os.str());
    frame.copyIn(buffer, length);
    frame.copyIn("\r\n");
    SLUICE_LOG_TRACE(g_log) << this << " chunk of " << length;
    writeAll(frame, frame.readAvailable());
    return length;
}

}}
