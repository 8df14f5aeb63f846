// Copyright (c) 2026 - Sluice contributors

#include <string.h>

#include "sluice/exception.h"
#include "sluice/socket.h"
#include "sluice/test/test.h"

using namespace Sluice;
using namespace Sluice::Test;

SLUICE_UNITTEST(Exception, errnoMapping)
{
    SLUICE_TEST_ASSERT_EXCEPTION(
        SLUICE_THROW_EXCEPTION_FROM_ERROR_API(ECANCELED, "send"),
        OperationAbortedException);
    SLUICE_TEST_ASSERT_EXCEPTION(
        SLUICE_THROW_EXCEPTION_FROM_ERROR_API(EPIPE, "send"),
        BrokenPipeException);
    SLUICE_TEST_ASSERT_EXCEPTION(
        SLUICE_THROW_EXCEPTION_FROM_ERROR_API(ECONNRESET, "recv"),
        ConnectionResetException);
    SLUICE_TEST_ASSERT_EXCEPTION(
        SLUICE_THROW_EXCEPTION_FROM_ERROR_API(ECONNABORTED, "accept"),
        SocketException);
    SLUICE_TEST_ASSERT_EXCEPTION(
        SLUICE_THROW_EXCEPTION_FROM_ERROR_API(ETIMEDOUT, "send"),
        TimedOutException);
}

SLUICE_UNITTEST(Exception, nativeErrorDetails)
{
    try {
        SLUICE_THROW_EXCEPTION_FROM_ERROR_API(EIO, "pread");
    } catch (NativeException &ex) {
        // EIO has no subclass of its own
        SLUICE_TEST_ASSERT(!dynamic_cast<SocketException *>(&ex));
        const int *error = boost::get_error_info<errinfo_nativeerror>(ex);
        SLUICE_TEST_ASSERT(error);
        SLUICE_TEST_ASSERT_EQUAL(*error, EIO);
        const char *const *api =
            boost::get_error_info<boost::errinfo_api_function>(ex);
        SLUICE_TEST_ASSERT(api);
        SLUICE_TEST_ASSERT_EQUAL(strcmp(*api, "pread"), 0);
        const int *line = boost::get_error_info<boost::throw_line>(ex);
        SLUICE_TEST_ASSERT(line);
        SLUICE_TEST_ASSERT(boost::get_error_info<errinfo_backtrace>(ex));
        return;
    }
}

static void
rethrowLater(boost::exception_ptr &saved)
{
    Sluice::rethrow_exception(saved);
}

SLUICE_UNITTEST(Exception, rethrowKeepsOriginalBacktrace)
{
    boost::exception_ptr saved;
    size_t original = 0;
    try {
        SLUICE_THROW_EXCEPTION(UnexpectedEofException());
    } catch (UnexpectedEofException &ex) {
        original = boost::get_error_info<errinfo_backtrace>(ex)->size();
        saved = boost::current_exception();
    }
    try {
        rethrowLater(saved);
    } catch (UnexpectedEofException &ex) {
        SLUICE_TEST_ASSERT_GREATER_THAN_OR_EQUAL(
            boost::get_error_info<errinfo_backtrace>(ex)->size(), original);
        return;
    }
}
