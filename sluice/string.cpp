// Copyright (c) 2009 - Mozy, Inc.

#include "string.h"

#include <strings.h>

#include "assert.h"

namespace Sluice {

std::vector<std::string>
split(const std::string &str, char delim, size_t max)
{
    SLUICE_ASSERT(max > 1);
    std::vector<std::string> result;
    if (str.empty())
        return result;
    size_t start = 0;
    while (result.size() + 1 < max) {
        size_t end = str.find(delim, start);
        if (end == std::string::npos)
            break;
        result.push_back(str.substr(start, end - start));
        start = end + 1;
    }
    result.push_back(str.substr(start));
    return result;
}

std::string
trim(const std::string &str, const char *chars)
{
    size_t first = str.find_first_not_of(chars);
    if (first == std::string::npos)
        return std::string();
    return str.substr(first, str.find_last_not_of(chars) + 1 - first);
}

bool
caseinsensitiveless::operator()(const std::string &lhs,
    const std::string &rhs) const
{
    return strcasecmp(lhs.c_str(), rhs.c_str()) < 0;
}

}
