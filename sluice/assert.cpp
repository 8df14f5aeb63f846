// Copyright (c) 2009 - Mozy, Inc.

#include "assert.h"

#include <exception>

#include "log.h"

namespace Sluice {

bool Assertion::throwOnAssertion = false;

void
assertionFailed(const char *expr, const char *file, int line)
{
    errinfo_backtrace bt(backtrace(1));
    Log::root()->log(Log::FATAL, file, line).os() << "ASSERTION: " << expr
        << "\nbacktrace:\n" << to_string(bt);
    if (!Assertion::throwOnAssertion)
        std::terminate();
    throw boost::enable_current_exception(Assertion(expr))
        << boost::throw_file(file) << boost::throw_line(line) << bt;
}

}
