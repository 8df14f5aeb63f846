#ifndef __SLUICE_FILES_RANGE_H__
#define __SLUICE_FILES_RANGE_H__
// Copyright (c) 2026 - Sluice contributors

#include <iosfwd>
#include <string>

#include "sluice/exception.h"
#include "sluice/http/http.h"

namespace Sluice {

/// The slice of a resource a response carries
struct ResolvedRange
{
    ResolvedRange()
        : status(HTTP::OK),
          start(0),
          length(0),
          total(0)
    {}

    /// OK or PARTIAL_CONTENT
    HTTP::Status status;
    unsigned long long start;
    unsigned long long length;
    /// Length of the whole resource
    unsigned long long total;

    /// Last byte, inclusive
    /// @pre length > 0
    unsigned long long end() const { return start + length - 1; }
    bool partial() const { return status == HTTP::PARTIAL_CONTENT; }
};

/// The Range header cannot be satisfied (REQUESTED_RANGE_NOT_SATISFIABLE) or
/// is malformed (BAD_REQUEST)
struct InvalidRangeException : virtual Exception
{
public:
    InvalidRangeException(HTTP::Status status, unsigned long long length,
        const std::string &message);
    ~InvalidRangeException() throw() {}

    HTTP::Status status() const { return m_status; }
    /// Length of the resource the range was resolved against
    unsigned long long length() const { return m_length; }

    const char *what() const throw() { return m_message.c_str(); }

private:
    HTTP::Status m_status;
    unsigned long long m_length;
    std::string m_message;
};

struct RangeParser
{
    /// Resolve a Range header against a resource of the given length
    ///
    /// Only a single "bytes" range is accepted.  An end beyond the resource
    /// is clamped, and a suffix longer than the resource selects all of it.
    /// @param hasRange If false, the whole resource is selected with status
    /// OK, and header is ignored
    /// @throws InvalidRangeException
    static ResolvedRange parse(bool hasRange, const std::string &header,
        unsigned long long length);
};

std::ostream &operator <<(std::ostream &os, const ResolvedRange &range);

}

#endif
