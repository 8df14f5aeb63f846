#ifndef __SLUICE_DAEMON_H__
#define __SLUICE_DAEMON_H__
// Copyright (c) 2010 - Mozy, Inc.

#include <boost/function.hpp>
#include <boost/signals2/signal.hpp>

namespace Sluice {
namespace Daemon {

/// @brief Run a process as a daemon
///
/// Runs daemonMain with argc/argv passed through, after masking the control
/// signals in every thread and starting a thread that waits for them:
///     * SIGTERM triggers onTerminate
///     * SIGINT triggers onInterrupt
///     * SIGHUP triggers onReload
/// If no slots are connected to a signal, it gets passed to the default
/// handler (which normally terminates the process).
/// If the daemonize ConfigVar is set, the process detaches from its terminal
/// first.
/// @note The signals are invoked on the signal thread, never on a thread
///       daemonMain created
/// @note run should be called *exactly* once, since the signals are global
///       for the process
int run(int argc, char **argv, boost::function<int (int, char **)> daemonMain);

extern boost::signals2::signal<void ()> onTerminate;
extern boost::signals2::signal<void ()> onInterrupt;
extern boost::signals2::signal<void ()> onReload;

}}

#endif
