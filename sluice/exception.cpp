// Copyright (c) 2009 - Mozy, Inc.

#include "exception.h"

#include <execinfo.h>
#include <netdb.h>
#include <stdlib.h>

#include <algorithm>
#include <sstream>

#include <boost/shared_ptr.hpp>

#include "socket.h"

namespace Sluice {

static const int g_maxFrames = 64;

std::vector<void *>
backtrace(int framesToSkip)
{
    std::vector<void *> result(g_maxFrames);
    result.resize(::backtrace(&result[0], g_maxFrames));
    // This frame is never interesting
    size_t skip = std::min(result.size(), (size_t)framesToSkip + 1);
    result.erase(result.begin(), result.begin() + skip);
    return result;
}

std::string
to_string(const errinfo_backtrace &bt)
{
    const std::vector<void *> &frames = bt.value();
    if (frames.empty())
        return std::string();
    boost::shared_ptr<char *> symbols(backtrace_symbols(&frames[0],
        (int)frames.size()), &free);
    std::ostringstream os;
    for (size_t i = 0; i < frames.size(); ++i) {
        if (i != 0)
            os << "\n";
        if (symbols)
            os << symbols.get()[i];
        else
            os << frames[i];
    }
    return os.str();
}

std::string
to_string(const errinfo_gaierror &e)
{
    std::ostringstream os;
    os << e.value() << ", \"" << gai_strerror(e.value()) << "\"";
    return os.str();
}

void
rethrow_exception(const boost::exception_ptr &ep)
{
    std::vector<void *> here = backtrace(1);
    try {
        boost::rethrow_exception(ep);
    } catch (boost::exception &ex) {
        const std::vector<void *> *original =
            boost::get_error_info<errinfo_backtrace>(ex);
        if (original)
            here.insert(here.begin(), original->begin(), original->end());
        ex << errinfo_backtrace(here);
        throw;
    }
}

template <class T>
BOOST_NORETURN static void
throwAs(int error, const char *api, const char *function, const char *file,
    int line)
{
    throw boost::enable_current_exception(T())
        << errinfo_nativeerror(error)
        << boost::errinfo_api_function(api)
        << boost::throw_function(function)
        << boost::throw_file(file)
        << boost::throw_line(line)
        << errinfo_backtrace(backtrace(2));
}

void
throwNativeError(int error, const char *api, const char *function,
    const char *file, int line)
{
    switch (error) {
        case ECANCELED:
            throwAs<OperationAbortedException>(error, api, function, file, line);
        case EPIPE:
            throwAs<BrokenPipeException>(error, api, function, file, line);
        case EADDRINUSE:
            throwAs<AddressInUseException>(error, api, function, file, line);
        case ECONNABORTED:
            throwAs<ConnectionAbortedException>(error, api, function, file, line);
        case ECONNRESET:
            throwAs<ConnectionResetException>(error, api, function, file, line);
        case ECONNREFUSED:
            throwAs<ConnectionRefusedException>(error, api, function, file, line);
        case ETIMEDOUT:
            throwAs<TimedOutException>(error, api, function, file, line);
        default:
            throwAs<NativeException>(error, api, function, file, line);
    }
}

}
