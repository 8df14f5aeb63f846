#ifndef __SLUICE_HTTP_PARSER_H__
#define __SLUICE_HTTP_PARSER_H__
// Copyright (c) 2026 - Sluice contributors

#include <utility>

#include "http.h"
#include "sluice/streams/stream.h"

namespace Sluice {
namespace HTTP {

/// Incremental parser for an HTTP message header
///
/// run() pulls one line at a time from a Stream that supports find() (a
/// BufferedStream), so it never consumes any of the message body.
class Parser
{
public:
    virtual ~Parser() {}

    /// Parse one complete message header from stream
    /// @return The number of bytes consumed; 0 means the stream was at EOF
    /// before the first byte of a message
    /// @throws IncompleteMessageHeaderException EOF in the middle of a header
    unsigned long long run(Stream &stream);
    unsigned long long run(Stream::ptr stream) { return run(*stream); }

    bool complete() const { return m_complete; }
    bool error() const { return m_error; }

protected:
    Parser();

    /// Reset the target structure before a parse
    virtual void init() = 0;
    /// @return false if the start line is malformed
    virtual bool startLine(const std::string &line) = 0;
    /// @return false if the header value is malformed
    virtual bool header(const std::string &name, const std::string &value) = 0;

    static bool parseVersion(const std::string &str, Version &version);
    static bool parseToken(const std::string &str);
    static bool parseUnsigned(const std::string &str, unsigned long long &value);
    static void parseList(const std::string &str, StringSet &set);
    static void parseList(const std::string &str, std::vector<std::string> &list);
    static bool parseParameterizedList(const std::string &str,
        ParameterizedList &list);
    static bool parseMediaType(const std::string &str, MediaType &mediaType);
    /// Common handling for General and Entity headers
    static bool generalOrEntityHeader(const std::string &name,
        const std::string &value, GeneralHeaders &general,
        EntityHeaders &entity);

private:
    bool line(const std::string &line);
    bool flushHeader();

private:
    bool m_complete, m_error, m_startLine;
    std::pair<std::string, std::string> m_header;
};

class RequestParser : public Parser
{
public:
    RequestParser(Request &request);

protected:
    void init();
    bool startLine(const std::string &line);
    bool header(const std::string &name, const std::string &value);

private:
    Request *m_request;
};

class ResponseParser : public Parser
{
public:
    ResponseParser(Response &response);

protected:
    void init();
    bool startLine(const std::string &line);
    bool header(const std::string &name, const std::string &value);

private:
    Response *m_response;
};

}}

#endif
