#ifndef __SLUICE_EXCEPTION_H__
#define __SLUICE_EXCEPTION_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <errno.h>

#include <stdexcept>
#include <string>
#include <vector>

#include <boost/exception/all.hpp>

namespace Sluice {

typedef boost::error_info<struct tag_backtrace, std::vector<void *> >
    errinfo_backtrace;
/// errno of the call that failed
typedef boost::errinfo_errno errinfo_nativeerror;

/// Return addresses on the calling thread's stack, innermost first
std::vector<void *> backtrace(int framesToSkip = 0);
/// One symbolized frame per line
std::string to_string(const errinfo_backtrace &bt);

/// Throw x with the throw site and a backtrace attached
#define SLUICE_THROW_EXCEPTION(x)                                               \
    throw ::boost::enable_current_exception(::boost::enable_error_info(x))      \
        << ::boost::throw_function(BOOST_CURRENT_FUNCTION)                      \
        << ::boost::throw_file(__FILE__)                                        \
        << ::boost::throw_line((int)__LINE__)                                   \
        << ::Sluice::errinfo_backtrace(::Sluice::backtrace())

/// boost::rethrow_exception, with the rethrowing stack appended to the
/// backtrace the exception already carries
void rethrow_exception(const boost::exception_ptr &ep);

struct Exception : virtual boost::exception, virtual std::exception {};

struct StreamException : virtual Exception {};
/// The peer closed before a complete message arrived
struct UnexpectedEofException : virtual StreamException {};
/// A write would go past the length a stream was framed to
struct WriteBeyondEofException : virtual StreamException {};
/// A delimiter wasn't found within the limit
struct BufferOverflowException : virtual StreamException {};

/// A system call failed; errinfo_nativeerror holds its errno
struct NativeException : virtual Exception {};
struct OperationAbortedException : virtual NativeException {};
struct BrokenPipeException : virtual NativeException {};

/// Throw the NativeException subclass that matches error, with the errno,
/// the api that failed and the throw site attached
BOOST_NORETURN void throwNativeError(int error, const char *api,
    const char *function, const char *file, int line);

#define SLUICE_THROW_EXCEPTION_FROM_ERROR_API(error, api)                       \
    ::Sluice::throwNativeError((error), (api), BOOST_CURRENT_FUNCTION,          \
        __FILE__, __LINE__)

#define SLUICE_THROW_EXCEPTION_FROM_LAST_ERROR_API(api)                         \
    SLUICE_THROW_EXCEPTION_FROM_ERROR_API(errno, api)

}

#endif
