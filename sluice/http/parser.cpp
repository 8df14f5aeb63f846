// Copyright (c) 2026 - Sluice contributors

#include "parser.h"

#include <ctype.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>

#include "sluice/config.h"
#include "sluice/log.h"
#include "sluice/string.h"

namespace Sluice {
namespace HTTP {

static ConfigVar<size_t>::ptr g_maxHeaderSize =
    Config::lookup<size_t>("http.maxheadersize", 65536,
    "Largest HTTP message header (start line plus all header fields) "
    "accepted");

static Logger::ptr g_log = Log::lookup("sluice:http:parser");

static const char *g_separators = "()<>@,;:\\\"/[]?={} \t";

Parser::Parser()
: m_complete(false),
  m_error(false),
  m_startLine(false)
{}

unsigned long long
Parser::run(Stream &stream)
{
    init();
    m_complete = m_error = m_startLine = false;
    m_header.first.clear();
    m_header.second.clear();

    size_t maxHeaderSize = g_maxHeaderSize->val();
    unsigned long long consumed = 0;
    while (!m_complete && !m_error) {
        if (consumed >= maxHeaderSize) {
            SLUICE_LOG_DEBUG(g_log) << this << " header exceeds "
                << maxHeaderSize << " bytes";
            m_error = true;
            break;
        }
        size_t sanitySize = maxHeaderSize - (size_t)consumed;
        ptrdiff_t offset = stream.find('\n', sanitySize);
        if (offset < 0) {
            size_t available = (size_t)(-offset - 1);
            if (available >= sanitySize) {
                SLUICE_LOG_DEBUG(g_log) << this << " header line exceeds "
                    << sanitySize << " bytes";
                m_error = true;
                break;
            }
            if (consumed == 0 && available == 0)
                return 0;
            SLUICE_THROW_EXCEPTION(IncompleteMessageHeaderException());
        }
        std::string text = stream.getDelimited('\n', sanitySize);
        consumed += text.size() + 1;
        if (!text.empty() && text[text.size() - 1] == '\r')
            text.resize(text.size() - 1);
        SLUICE_LOG_TRACE(g_log) << this << " line '" << text << "'";
        if (!line(text))
            m_error = true;
    }
    return consumed;
}

bool
Parser::line(const std::string &text)
{
    if (!m_startLine) {
        // Tolerate empty lines ahead of the start line
        if (text.empty())
            return true;
        m_startLine = true;
        return startLine(text);
    }
    if (text.empty()) {
        if (!flushHeader())
            return false;
        m_complete = true;
        return true;
    }
    if (text[0] == ' ' || text[0] == '\t') {
        // Obsolete line folding continues the previous header
        if (m_header.first.empty())
            return false;
        m_header.second.append(" ");
        m_header.second.append(trim(text));
        return true;
    }
    if (!flushHeader())
        return false;
    size_t colon = text.find(':');
    if (colon == std::string::npos || colon == 0)
        return false;
    m_header.first = text.substr(0, colon);
    if (!parseToken(m_header.first))
        return false;
    m_header.second = trim(text.substr(colon + 1));
    return true;
}

bool
Parser::flushHeader()
{
    if (m_header.first.empty())
        return true;
    bool result = header(m_header.first, m_header.second);
    if (!result)
        SLUICE_LOG_DEBUG(g_log) << this << " invalid " << m_header.first
            << " header '" << m_header.second << "'";
    m_header.first.clear();
    m_header.second.clear();
    return result;
}

bool
Parser::parseVersion(const std::string &str, Version &version)
{
    if (str.size() != 8 || str.compare(0, 5, "HTTP/") != 0 ||
        !isdigit((unsigned char)str[5]) || str[6] != '.' ||
        !isdigit((unsigned char)str[7]))
        return false;
    version.major = (unsigned char)(str[5] - '0');
    version.minor = (unsigned char)(str[7] - '0');
    return true;
}

bool
Parser::parseToken(const std::string &str)
{
    if (str.empty())
        return false;
    for (std::string::const_iterator it = str.begin(); it != str.end(); ++it) {
        unsigned char c = (unsigned char)*it;
        if (c <= 32 || c >= 127 || strchr(g_separators, c))
            return false;
    }
    return true;
}

bool
Parser::parseUnsigned(const std::string &str, unsigned long long &value)
{
    if (str.empty() || str.size() > 19 ||
        str.find_first_not_of("0123456789") != std::string::npos)
        return false;
    value = strtoull(str.c_str(), NULL, 10);
    return true;
}

void
Parser::parseList(const std::string &str, StringSet &set)
{
    std::vector<std::string> list = split(str, ',');
    for (std::vector<std::string>::iterator it = list.begin();
        it != list.end();
        ++it) {
        std::string value = trim(*it);
        if (!value.empty())
            set.insert(value);
    }
}

void
Parser::parseList(const std::string &str, std::vector<std::string> &list)
{
    std::vector<std::string> items = split(str, ',');
    for (std::vector<std::string>::iterator it = items.begin();
        it != items.end();
        ++it) {
        std::string value = trim(*it);
        if (!value.empty())
            list.push_back(value);
    }
}

static bool parseParameters(const std::vector<std::string> &pieces,
    StringMap &parameters)
{
    for (size_t i = 1; i < pieces.size(); ++i) {
        std::string parameter = trim(pieces[i]);
        if (parameter.empty())
            continue;
        size_t equals = parameter.find('=');
        std::string key = trim(parameter.substr(0, equals));
        if (key.empty())
            return false;
        std::string value;
        if (equals != std::string::npos)
            value = trim(parameter.substr(equals + 1));
        if (value.size() >= 2 && value[0] == '"' &&
            value[value.size() - 1] == '"')
            value = value.substr(1, value.size() - 2);
        parameters[key] = value;
    }
    return true;
}

bool
Parser::parseParameterizedList(const std::string &str,
    ParameterizedList &list)
{
    std::vector<std::string> items = split(str, ',');
    for (std::vector<std::string>::iterator it = items.begin();
        it != items.end();
        ++it) {
        std::vector<std::string> pieces = split(*it, ';');
        if (pieces.empty())
            continue;
        ValueWithParameters value(trim(pieces[0]));
        if (value.value.empty())
            continue;
        if (!parseToken(value.value))
            return false;
        if (!parseParameters(pieces, value.parameters))
            return false;
        list.push_back(value);
    }
    return true;
}

bool
Parser::parseMediaType(const std::string &str, MediaType &mediaType)
{
    std::vector<std::string> pieces = split(str, ';');
    if (pieces.empty())
        return false;
    std::string type = trim(pieces[0]);
    size_t slash = type.find('/');
    if (slash == std::string::npos)
        return false;
    mediaType.type = type.substr(0, slash);
    mediaType.subtype = type.substr(slash + 1);
    if (!parseToken(mediaType.type) || !parseToken(mediaType.subtype))
        return false;
    return parseParameters(pieces, mediaType.parameters);
}

bool
Parser::generalOrEntityHeader(const std::string &name, const std::string &value,
    GeneralHeaders &general, EntityHeaders &entity)
{
    if (strcasecmp(name.c_str(), "Connection") == 0) {
        parseList(value, general.connection);
    } else if (strcasecmp(name.c_str(), "Date") == 0) {
        general.date = parseHttpDate(value);
    } else if (strcasecmp(name.c_str(), "Transfer-Encoding") == 0) {
        return parseParameterizedList(value, general.transferEncoding);
    } else if (strcasecmp(name.c_str(), "Allow") == 0) {
        parseList(value, entity.allow);
    } else if (strcasecmp(name.c_str(), "Content-Length") == 0) {
        unsigned long long contentLength;
        if (!parseUnsigned(value, contentLength))
            return false;
        // Repeated Content-Length must agree
        if (entity.contentLength != ~0ull &&
            entity.contentLength != contentLength)
            return false;
        entity.contentLength = contentLength;
    } else if (strcasecmp(name.c_str(), "Content-Type") == 0) {
        return parseMediaType(value, entity.contentType);
    } else if (strcasecmp(name.c_str(), "Last-Modified") == 0) {
        entity.lastModified = parseHttpDate(value);
    } else {
        std::string &existing = entity.extension[name];
        if (!existing.empty())
            existing.append(", ");
        existing.append(value);
    }
    return true;
}

RequestParser::RequestParser(Request &request)
: m_request(&request)
{}

void
RequestParser::init()
{
    *m_request = Request();
}

bool
RequestParser::startLine(const std::string &line)
{
    std::vector<std::string> pieces = split(line, ' ');
    if (pieces.size() != 3)
        return false;
    if (!parseToken(pieces[0]) || pieces[1].empty())
        return false;
    m_request->requestLine.method = pieces[0];
    m_request->requestLine.uri = pieces[1];
    return parseVersion(pieces[2], m_request->requestLine.ver);
}

bool
RequestParser::header(const std::string &name, const std::string &value)
{
    RequestHeaders &request = m_request->request;
    if (strcasecmp(name.c_str(), "Host") == 0) {
        request.host = value;
    } else if (strcasecmp(name.c_str(), "Range") == 0) {
        // Repeated Range headers combine like any other list header
        if (request.hasRange)
            request.range.append(", ");
        request.range.append(value);
        request.hasRange = true;
    } else if (strcasecmp(name.c_str(), "Expect") == 0) {
        parseList(value, request.expect);
    } else {
        return generalOrEntityHeader(name, value, m_request->general,
            m_request->entity);
    }
    return true;
}

ResponseParser::ResponseParser(Response &response)
: m_response(&response)
{}

void
ResponseParser::init()
{
    *m_response = Response();
}

bool
ResponseParser::startLine(const std::string &line)
{
    std::vector<std::string> pieces = split(line, ' ', 3);
    if (pieces.size() < 2)
        return false;
    if (!parseVersion(pieces[0], m_response->status.ver))
        return false;
    unsigned long long status;
    if (pieces[1].size() != 3 || !parseUnsigned(pieces[1], status))
        return false;
    m_response->status.status = (Status)status;
    if (pieces.size() == 3)
        m_response->status.reason = pieces[2];
    return true;
}

static bool parseContentRange(const std::string &str, ContentRange &range)
{
    if (str.compare(0, 6, "bytes ") != 0)
        return false;
    std::string byteRange = trim(str.substr(6));
    size_t slash = byteRange.find('/');
    if (slash == std::string::npos)
        return false;
    std::string first = byteRange.substr(0, slash);
    std::string instance = byteRange.substr(slash + 1);
    char *end;
    if (instance != "*") {
        if (instance.empty() ||
            instance.find_first_not_of("0123456789") != std::string::npos)
            return false;
        range.instance = strtoull(instance.c_str(), &end, 10);
    }
    if (first == "*")
        return true;
    size_t dash = first.find('-');
    if (dash == std::string::npos || dash == 0 || dash == first.size() - 1 ||
        first.find_first_not_of("0123456789-") != std::string::npos)
        return false;
    range.first = strtoull(first.c_str(), &end, 10);
    range.last = strtoull(first.c_str() + dash + 1, &end, 10);
    return range.first <= range.last;
}

bool
ResponseParser::header(const std::string &name, const std::string &value)
{
    ResponseHeaders &response = m_response->response;
    if (strcasecmp(name.c_str(), "Accept-Ranges") == 0) {
        parseList(value, response.acceptRanges);
    } else if (strcasecmp(name.c_str(), "Server") == 0) {
        response.server = value;
    } else if (strcasecmp(name.c_str(), "Content-Range") == 0) {
        return parseContentRange(value, m_response->entity.contentRange);
    } else {
        return generalOrEntityHeader(name, value, m_response->general,
            m_response->entity);
    }
    return true;
}

}}
