// Copyright (c) 2010 - Mozy, Inc.

#include "daemon.h"

#include <errno.h>
#include <pthread.h>
#include <signal.h>
#include <string.h>
#include <unistd.h>

#include <boost/bind.hpp>
#include <boost/thread/thread.hpp>

#include "config.h"
#include "log.h"

namespace Sluice {
namespace Daemon {

static Logger::ptr g_log = Log::lookup("sluice:daemon");

static ConfigVar<bool>::ptr g_daemonize = Config::lookup("daemonize", false,
    "Detach from the terminal");

boost::signals2::signal<void ()> onTerminate;
boost::signals2::signal<void ()> onInterrupt;
boost::signals2::signal<void ()> onReload;

static boost::signals2::signal<void ()> *
handlersFor(int signal)
{
    switch (signal) {
        case SIGTERM:
            return &onTerminate;
        case SIGINT:
            return &onInterrupt;
        default:
            return &onReload;
    }
}

// Nobody is listening, so let the default action (usually exit) happen
static void
raiseUnhandled(int signal)
{
    sigset_t only;
    sigemptyset(&only);
    sigaddset(&only, signal);
    pthread_sigmask(SIG_UNBLOCK, &only, NULL);
    raise(signal);
    pthread_sigmask(SIG_BLOCK, &only, NULL);
}

static void
waitForSignals(sigset_t mask)
{
    while (true) {
        int caught;
        if (sigwait(&mask, &caught))
            continue;
        SLUICE_LOG_INFO(g_log) << "received " << strsignal(caught);
        boost::signals2::signal<void ()> *handlers = handlersFor(caught);
        if (handlers->empty())
            raiseUnhandled(caught);
        else
            (*handlers)();
    }
}

int run(int argc, char **argv,
    boost::function<int (int, char **)> daemonMain)
{
    if (g_daemonize->val()) {
        SLUICE_LOG_VERBOSE(g_log) << "daemonizing";
        if (daemon(1, 0) == -1)
            return errno;
    }

    // Threads inherit the mask, so only the signal thread sees these
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGHUP);
    int rc = pthread_sigmask(SIG_BLOCK, &mask, NULL);
    if (rc != 0)
        return rc;
    boost::thread(boost::bind(&waitForSignals, mask)).detach();

    SLUICE_LOG_INFO(g_log) << "starting";
    rc = daemonMain(argc, argv);
    SLUICE_LOG_INFO(g_log) << "stopped with " << rc;
    return rc;
}

}}
