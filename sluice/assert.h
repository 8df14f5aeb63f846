#ifndef __SLUICE_ASSERT_H__
#define __SLUICE_ASSERT_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <boost/config.hpp>

#include "exception.h"

namespace Sluice {

/// A SLUICE_ASSERT failed
struct Assertion : virtual Exception
{
    Assertion(const std::string &expr) : m_expr(expr) {}
    ~Assertion() throw() {}

    const char *what() const throw() { return m_expr.c_str(); }

    /// Set by the test runner so a failed assertion fails only its test;
    /// otherwise the process terminates
    static bool throwOnAssertion;

private:
    std::string m_expr;
};

/// Log expr at FATAL with a backtrace, then throw Assertion or terminate
BOOST_NORETURN void assertionFailed(const char *expr, const char *file,
    int line);

}

// Checked in every build type; x is always evaluated exactly once
#define SLUICE_ASSERT(x)                                                        \
    ((x) ? (void)0 : ::Sluice::assertionFailed(#x, __FILE__, __LINE__))

#define SLUICE_NOTREACHED()                                                     \
    ::Sluice::assertionFailed("not reached", __FILE__, __LINE__)

#endif
