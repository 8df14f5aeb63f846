#ifndef __SLUICE_STRING_H__
#define __SLUICE_STRING_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <string>
#include <vector>

namespace Sluice {

/// Split str at each delim; the last piece takes the rest once there are
/// max - 1 pieces
/// @return Nothing for an empty str
std::vector<std::string> split(const std::string &str, char delim,
    size_t max = ~0);

/// Strip leading and trailing characters in chars
std::string trim(const std::string &str, const char *chars = " \t\r\n");

/// Orders header names and tokens the way HTTP compares them
struct caseinsensitiveless
{
    bool operator()(const std::string &lhs, const std::string &rhs) const;
};

}

#endif
