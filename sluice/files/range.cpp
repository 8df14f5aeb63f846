// Copyright (c) 2026 - Sluice contributors

#include "range.h"

#include <strings.h>

#include <ostream>

#include "sluice/string.h"

namespace Sluice {

InvalidRangeException::InvalidRangeException(HTTP::Status status,
    unsigned long long length, const std::string &message)
: m_status(status),
  m_length(length),
  m_message(message)
{}

// Digits only; saturates instead of overflowing
static bool
parsePosition(const std::string &str, unsigned long long &value)
{
    if (str.empty())
        return false;
    value = 0;
    for (std::string::const_iterator it = str.begin(); it != str.end(); ++it) {
        if (*it < '0' || *it > '9')
            return false;
        unsigned long long digit = *it - '0';
        if (value > (~0ull - digit) / 10)
            value = ~0ull;
        else
            value = value * 10 + digit;
    }
    return true;
}

ResolvedRange
RangeParser::parse(bool hasRange, const std::string &header,
    unsigned long long length)
{
    ResolvedRange result;
    result.total = length;
    if (!hasRange) {
        result.status = HTTP::OK;
        result.length = length;
        return result;
    }

    std::string value = trim(header);
    if (value.size() < 6 || strncasecmp(value.c_str(), "bytes", 5) != 0)
        SLUICE_THROW_EXCEPTION(InvalidRangeException(HTTP::BAD_REQUEST,
            length, "Unsupported range unit."));
    value = trim(value.substr(5));
    if (value.empty() || value[0] != '=')
        SLUICE_THROW_EXCEPTION(InvalidRangeException(HTTP::BAD_REQUEST,
            length, "Malformed range."));
    value = trim(value.substr(1));
    if (value.find(',') != std::string::npos)
        SLUICE_THROW_EXCEPTION(InvalidRangeException(HTTP::BAD_REQUEST,
            length, "Multiple ranges are not supported."));
    size_t dash = value.find('-');
    if (dash == std::string::npos || value.find('-', dash + 1) != std::string::npos)
        SLUICE_THROW_EXCEPTION(InvalidRangeException(HTTP::BAD_REQUEST,
            length, "Malformed range."));
    std::string firstStr = trim(value.substr(0, dash));
    std::string lastStr = trim(value.substr(dash + 1));
    unsigned long long first = 0, last = ~0ull;

    if (firstStr.empty()) {
        // Suffix: the last N bytes
        unsigned long long suffix;
        if (!parsePosition(lastStr, suffix) || suffix == 0)
            SLUICE_THROW_EXCEPTION(InvalidRangeException(HTTP::BAD_REQUEST,
                length, "Malformed range."));
        if (length == 0)
            SLUICE_THROW_EXCEPTION(InvalidRangeException(
                HTTP::REQUESTED_RANGE_NOT_SATISFIABLE, length,
                "Range not satisfiable."));
        if (suffix >= length)
            first = 0;
        else
            first = length - suffix;
        last = length - 1;
    } else {
        if (!parsePosition(firstStr, first) ||
            (!lastStr.empty() && !parsePosition(lastStr, last)))
            SLUICE_THROW_EXCEPTION(InvalidRangeException(HTTP::BAD_REQUEST,
                length, "Malformed range."));
        if (first > last)
            SLUICE_THROW_EXCEPTION(InvalidRangeException(HTTP::BAD_REQUEST,
                length, "Range start is after its end."));
        if (first >= length)
            SLUICE_THROW_EXCEPTION(InvalidRangeException(
                HTTP::REQUESTED_RANGE_NOT_SATISFIABLE, length,
                "Range not satisfiable."));
        if (last >= length)
            last = length - 1;
    }

    result.status = HTTP::PARTIAL_CONTENT;
    result.start = first;
    result.length = last - first + 1;
    return result;
}

std::ostream &
operator <<(std::ostream &os, const ResolvedRange &range)
{
    os << range.status << " ";
    if (range.length == 0)
        return os << "empty/" << range.total;
    return os << range.start << "-" << range.end() << "/" << range.total;
}

}
