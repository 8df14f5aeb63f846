#ifndef __SLUICE_HTTP_H__
#define __SLUICE_HTTP_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <iosfwd>
#include <map>
#include <set>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>

#include "sluice/exception.h"
#include "sluice/string.h"

namespace Sluice {
namespace HTTP {

/// The connection closed in the middle of a message header
struct IncompleteMessageHeaderException : virtual StreamException {};

extern const std::string GET;
extern const std::string HEAD;
extern const std::string POST;

/// The status codes this server sends or expects to see
enum Status
{
    INVALID                          = 0,
    CONTINUE                         = 100,
    OK                               = 200,
    NO_CONTENT                       = 204,
    PARTIAL_CONTENT                  = 206,
    NOT_MODIFIED                     = 304,
    BAD_REQUEST                      = 400,
    NOT_FOUND                        = 404,
    METHOD_NOT_ALLOWED               = 405,
    LENGTH_REQUIRED                  = 411,
    REQUESTED_RANGE_NOT_SATISFIABLE  = 416,
    EXPECTATION_FAILED               = 417,
    INTERNAL_SERVER_ERROR            = 500,
    NOT_IMPLEMENTED                  = 501,
    HTTP_VERSION_NOT_SUPPORTED       = 505
};
/// The reason phrase sent with s
const char *reason(Status s);

/// Parse an RFC 1123 date ("Sun, 06 Nov 1994 08:49:37 GMT")
/// @return not_a_date_time if str is not one
boost::posix_time::ptime parseHttpDate(const std::string &str);

/// HTTP/major.minor; default constructed, it is not yet known
struct Version
{
    Version() : major(~0), minor(~0) {}
    Version(unsigned char m, unsigned char n) : major(m), minor(n) {}

    unsigned char major, minor;

    bool operator==(const Version &rhs) const
    { return major == rhs.major && minor == rhs.minor; }
    bool operator!=(const Version &rhs) const { return !(*this == rhs); }
    bool operator>=(const Version &rhs) const
    { return major != rhs.major ? major > rhs.major : minor >= rhs.minor; }
};

typedef std::set<std::string, caseinsensitiveless> StringSet;
typedef std::map<std::string, std::string, caseinsensitiveless> StringMap;

/// One element of a list header such as Transfer-Encoding: "gzip;level=9"
struct ValueWithParameters
{
    ValueWithParameters() {}
    ValueWithParameters(const char *v) : value(v) {}
    ValueWithParameters(const std::string &v) : value(v) {}

    std::string value;
    StringMap parameters;
};
typedef std::vector<ValueWithParameters> ParameterizedList;

struct MediaType
{
    MediaType() {}
    MediaType(const std::string &t, const std::string &s)
        : type(t), subtype(s)
    {}

    std::string type, subtype;
    StringMap parameters;
};

/// Content-Range: bytes first-last/instance
///
/// first == ~0ull renders the unsatisfied form "bytes */instance".
struct ContentRange
{
    ContentRange(unsigned long long f = ~0ull, unsigned long long l = ~0ull,
        unsigned long long i = ~0ull)
        : first(f), last(l), instance(i)
    {}

    bool empty() const
    { return first == ~0ull && last == ~0ull && instance == ~0ull; }

    bool operator==(const ContentRange &rhs) const
    {
        return first == rhs.first && (first == ~0ull || last == rhs.last) &&
            instance == rhs.instance;
    }

    unsigned long long first, last, instance;
};

struct RequestLine
{
    RequestLine() : method(GET) {}

    std::string method;
    /// request-target, exactly as it appeared on the wire
    std::string uri;
    Version ver;
};

struct StatusLine
{
    StatusLine() : status(OK) {}

    Status status;
    /// Filled in from reason() when the response is sent, if left empty
    std::string reason;
    Version ver;
};

// Headers are grouped the way RFC 2616 groups them.  Only the fields this
// server reads or writes get members; any other field of an entity lands in
// EntityHeaders::extension.

struct GeneralHeaders
{
    StringSet connection;
    boost::posix_time::ptime date;
    ParameterizedList transferEncoding;
};

struct RequestHeaders
{
    RequestHeaders() : hasRange(false) {}

    StringSet expect;
    std::string host;
    /// Raw value of the Range header; validated against the resource length
    /// once that is known
    std::string range;
    bool hasRange;
};

struct ResponseHeaders
{
    StringSet acceptRanges;
    std::string server;
};

struct EntityHeaders
{
    EntityHeaders() : contentLength(~0ull) {}

    std::vector<std::string> allow;
    /// ~0ull when absent
    unsigned long long contentLength;
    ContentRange contentRange;
    MediaType contentType;
    boost::posix_time::ptime lastModified;
    StringMap extension;
};

struct Request
{
    RequestLine requestLine;
    GeneralHeaders general;
    RequestHeaders request;
    EntityHeaders entity;
};

struct Response
{
    StatusLine status;
    GeneralHeaders general;
    ResponseHeaders response;
    EntityHeaders entity;
};

std::ostream &operator<<(std::ostream &os, Status s);
std::ostream &operator<<(std::ostream &os, Version v);
std::ostream &operator<<(std::ostream &os, const ValueWithParameters &v);
std::ostream &operator<<(std::ostream &os, const MediaType &m);
std::ostream &operator<<(std::ostream &os, const ContentRange &cr);
std::ostream &operator<<(std::ostream &os, const RequestLine &r);
std::ostream &operator<<(std::ostream &os, const StatusLine &s);

/// The message header exactly as it goes on the wire, through the blank line
std::ostream &operator<<(std::ostream &os, const Request &r);
std::ostream &operator<<(std::ostream &os, const Response &r);

}}

#endif
