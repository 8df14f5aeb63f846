// Copyright (c) 2009 - Mozy, Inc.

#include "http.h"

#include <locale>
#include <ostream>
#include <sstream>

#include "sluice/assert.h"

namespace Sluice {
namespace HTTP {

#define RFC1123_FORMAT "%a, %d %b %Y %H:%M:%S GMT"

// Facets are reference counted by the locales they're imbued in; starting at
// one keeps these alive for the life of the process
static boost::posix_time::time_facet g_dateOut(RFC1123_FORMAT,
    boost::posix_time::time_facet::period_formatter_type(),
    boost::posix_time::time_facet::special_values_formatter_type(),
    boost::posix_time::time_facet::date_gen_formatter_type(), 1);
static boost::posix_time::time_input_facet g_dateIn(RFC1123_FORMAT, 1);

const std::string GET("GET");
const std::string HEAD("HEAD");
const std::string POST("POST");

namespace {
struct ReasonPhrase
{
    Status status;
    const char *text;
};

const ReasonPhrase g_reasons[] = {
    { CONTINUE, "Continue" },
    { OK, "OK" },
    { NO_CONTENT, "No Content" },
    { PARTIAL_CONTENT, "Partial Content" },
    { NOT_MODIFIED, "Not Modified" },
    { BAD_REQUEST, "Bad Request" },
    { NOT_FOUND, "Not Found" },
    { METHOD_NOT_ALLOWED, "Method Not Allowed" },
    { LENGTH_REQUIRED, "Length Required" },
    { REQUESTED_RANGE_NOT_SATISFIABLE, "Requested Range Not Satisfiable" },
    { EXPECTATION_FAILED, "Expectation Failed" },
    { INTERNAL_SERVER_ERROR, "Internal Server Error" },
    { NOT_IMPLEMENTED, "Not Implemented" },
    { HTTP_VERSION_NOT_SUPPORTED, "HTTP Version Not Supported" }
};

// "a, b, c"
template <class Iterator>
void
joinTo(std::ostream &os, Iterator begin, Iterator end)
{
    for (Iterator it = begin; it != end; ++it) {
        if (it != begin)
            os << ", ";
        os << *it;
    }
}

template <class Container>
void
listField(std::ostream &os, const char *name, const Container &values)
{
    if (values.empty())
        return;
    os << name << ": ";
    joinTo(os, values.begin(), values.end());
    os << "\r\n";
}

void
stringField(std::ostream &os, const char *name, const std::string &value)
{
    if (!value.empty())
        os << name << ": " << value << "\r\n";
}

void
dateField(std::ostream &os, const char *name,
    const boost::posix_time::ptime &value)
{
    if (!value.is_not_a_date_time())
        os << name << ": " << value << "\r\n";
}

void
parametersTo(std::ostream &os, const StringMap &parameters)
{
    for (StringMap::const_iterator it = parameters.begin();
        it != parameters.end(); ++it) {
        os << ";" << it->first;
        if (!it->second.empty())
            os << "=" << it->second;
    }
}

void
generalFields(std::ostream &os, const GeneralHeaders &general)
{
    listField(os, "Connection", general.connection);
    dateField(os, "Date", general.date);
    listField(os, "Transfer-Encoding", general.transferEncoding);
}

void
entityFields(std::ostream &os, const EntityHeaders &entity)
{
    listField(os, "Allow", entity.allow);
    if (entity.contentLength != ~0ull)
        os << "Content-Length: " << entity.contentLength << "\r\n";
    if (!entity.contentRange.empty())
        os << "Content-Range: " << entity.contentRange << "\r\n";
    if (!entity.contentType.type.empty())
        os << "Content-Type: " << entity.contentType << "\r\n";
    dateField(os, "Last-Modified", entity.lastModified);
    for (StringMap::const_iterator it = entity.extension.begin();
        it != entity.extension.end(); ++it)
        os << it->first << ": " << it->second << "\r\n";
    os << "\r\n";
}
}

const char *
reason(Status s)
{
    for (size_t i = 0; i < sizeof(g_reasons) / sizeof(g_reasons[0]); ++i) {
        if (g_reasons[i].status == s)
            return g_reasons[i].text;
    }
    return "<INVALID>";
}

boost::posix_time::ptime
parseHttpDate(const std::string &str)
{
    std::istringstream is(str);
    is.imbue(std::locale(is.getloc(), &g_dateIn));
    boost::posix_time::ptime result;
    is >> result;
    return is.fail() ? boost::posix_time::ptime() : result;
}

std::ostream &
operator<<(std::ostream &os, Status s)
{
    return os << (int)s;
}

std::ostream &
operator<<(std::ostream &os, Version v)
{
    if (v == Version())
        return os << "HTTP/0.0";
    return os << "HTTP/" << (int)v.major << "." << (int)v.minor;
}

std::ostream &
operator<<(std::ostream &os, const ValueWithParameters &v)
{
    SLUICE_ASSERT(!v.value.empty());
    os << v.value;
    parametersTo(os, v.parameters);
    return os;
}

std::ostream &
operator<<(std::ostream &os, const MediaType &m)
{
    SLUICE_ASSERT(!m.type.empty() && !m.subtype.empty());
    os << m.type << "/" << m.subtype;
    parametersTo(os, m.parameters);
    return os;
}

std::ostream &
operator<<(std::ostream &os, const ContentRange &cr)
{
    os << "bytes ";
    if (cr.first == ~0ull)
        os << "*/";
    else
        os << cr.first << "-" << cr.last << "/";
    if (cr.instance == ~0ull)
        return os << "*";
    return os << cr.instance;
}

std::ostream &
operator<<(std::ostream &os, const RequestLine &r)
{
    return os << r.method << " " << (r.uri.empty() ? "*" : r.uri) << " "
        << r.ver;
}

std::ostream &
operator<<(std::ostream &os, const StatusLine &s)
{
    return os << s.ver << " " << s.status << " " << s.reason;
}

std::ostream &
operator<<(std::ostream &os, const Request &r)
{
    os.imbue(std::locale(os.getloc(), &g_dateOut));
    os << r.requestLine << "\r\n";
    generalFields(os, r.general);
    listField(os, "Expect", r.request.expect);
    stringField(os, "Host", r.request.host);
    if (r.request.hasRange)
        os << "Range: " << r.request.range << "\r\n";
    entityFields(os, r.entity);
    return os;
}

std::ostream &
operator<<(std::ostream &os, const Response &r)
{
    SLUICE_ASSERT(!r.status.reason.empty());
    os.imbue(std::locale(os.getloc(), &g_dateOut));
    os << r.status.ver << " " << r.status.status << " " << r.status.reason
        << "\r\n";
    generalFields(os, r.general);
    listField(os, "Accept-Ranges", r.response.acceptRanges);
    stringField(os, "Server", r.response.server);
    entityFields(os, r.entity);
    return os;
}

}}
