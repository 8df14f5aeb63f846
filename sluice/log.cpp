// Copyright (c) 2009 - Mozy, Inc.

#include "log.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <iostream>
#include <map>

#define SYSLOG_NAMES
#include <syslog.h>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/regex.hpp>
#include <boost/thread/mutex.hpp>

#include "assert.h"
#include "config.h"
#include "fiber.h"
#include "timer.h"

namespace Sluice {

static ConfigVar<std::string>::ptr g_logError =
    Config::lookup("log.errormask", std::string(".*"),
        "Regex of loggers to enable error for");
static ConfigVar<std::string>::ptr g_logWarn =
    Config::lookup("log.warnmask", std::string(".*"),
        "Regex of loggers to enable warning for");
static ConfigVar<std::string>::ptr g_logInfo =
    Config::lookup("log.infomask", std::string(".*"),
        "Regex of loggers to enable info for");
static ConfigVar<std::string>::ptr g_logVerbose =
    Config::lookup("log.verbosemask", std::string(),
        "Regex of loggers to enable verbose for");
static ConfigVar<std::string>::ptr g_logDebug =
    Config::lookup("log.debugmask", std::string(),
        "Regex of loggers to enable debugging for");
static ConfigVar<std::string>::ptr g_logTrace =
    Config::lookup("log.tracemask", std::string(),
        "Regex of loggers to enable trace for");

static ConfigVar<bool>::ptr g_logStdout =
    Config::lookup("log.stdout", false, "Log to stdout");
static ConfigVar<std::string>::ptr g_logFile =
    Config::lookup("log.file", std::string(), "Append log lines to this file");
static ConfigVar<std::string>::ptr g_logSyslogFacility =
    Config::lookup("log.syslogfacility", std::string(),
        "Log to syslog using this facility");

static Logger::ptr g_log = Log::lookup("sluice:log");

// Set while a Fiber is inside a sink, so a sink that logs can't recurse
static FiberLocalStorage<bool> f_inSink;

static unsigned long long g_start = TimerManager::now();

namespace {

struct Registry
{
    boost::mutex mutex;
    std::map<std::string, Logger::ptr> loggers;
};

class StdoutLogSink : public LogSink
{
public:
    void log(Log::Level level, const std::string &line)
    {
        std::cout << line;
        std::cout.flush();
    }
};

// O_APPEND and one write(2) per line, so processes can share the file
class FileLogSink : public LogSink, boost::noncopyable
{
public:
    FileLogSink(const std::string &file)
    {
        m_fd = open(file.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC,
            0644);
        if (m_fd < 0)
            SLUICE_THROW_EXCEPTION_FROM_LAST_ERROR_API("open");
    }
    ~FileLogSink() { close(m_fd); }

    void log(Log::Level level, const std::string &line)
    {
        size_t written = 0;
        while (written < line.size()) {
            ssize_t rc = write(m_fd, line.c_str() + written,
                line.size() - written);
            if (rc < 0 && errno == EINTR)
                continue;
            // Nowhere left to report it
            if (rc <= 0)
                return;
            written += rc;
        }
    }

private:
    int m_fd;
};

class SyslogLogSink : public LogSink
{
public:
    SyslogLogSink(int facility) : m_facility(facility) {}

    void log(Log::Level level, const std::string &line)
    {
        int priority;
        switch (level) {
            case Log::FATAL:
                priority = LOG_CRIT;
                break;
            case Log::ERROR:
                priority = LOG_ERR;
                break;
            case Log::WARNING:
                priority = LOG_WARNING;
                break;
            case Log::INFO:
                priority = LOG_NOTICE;
                break;
            case Log::VERBOSE:
                priority = LOG_INFO;
                break;
            default:
                priority = LOG_DEBUG;
                break;
        }
        syslog(priority | m_facility, "%.*s", (int)line.size(), line.c_str());
    }

private:
    int m_facility;
};

}

static Registry &
registry()
{
    static Registry registry;
    return registry;
}

static bool
validMask(const std::string &mask)
{
    try {
        boost::regex compiled(mask);
    } catch (boost::regex_error &) {
        return false;
    }
    return true;
}

// The most verbose level whose mask matches wins
static Log::Level
levelFor(const std::string &name)
{
    const ConfigVar<std::string>::ptr masks[] = { g_logTrace, g_logDebug,
        g_logVerbose, g_logInfo, g_logWarn, g_logError };
    const Log::Level levels[] = { Log::TRACE, Log::DEBUG, Log::VERBOSE,
        Log::INFO, Log::WARNING, Log::ERROR };
    for (size_t i = 0; i < sizeof(levels) / sizeof(levels[0]); ++i) {
        if (boost::regex_match(name, boost::regex(masks[i]->val())))
            return levels[i];
    }
    return Log::FATAL;
}

static void
applyMasks()
{
    Log::root()->level(levelFor(Log::root()->name()));
    Registry &loggers = registry();
    boost::mutex::scoped_lock lock(loggers.mutex);
    for (std::map<std::string, Logger::ptr>::iterator it =
        loggers.loggers.begin(); it != loggers.loggers.end(); ++it)
        it->second->level(levelFor(it->first));
}

static void
replaceSink(LogSink::ptr &current, LogSink::ptr replacement)
{
    if (current)
        Log::root()->removeSink(current);
    current = replacement;
    if (current)
        Log::root()->addSink(current);
}

static void
enableStdoutLogging()
{
    static LogSink::ptr sink;
    if (g_logStdout->val() != (sink.get() != NULL))
        replaceSink(sink, g_logStdout->val() ?
            LogSink::ptr(new StdoutLogSink()) : LogSink::ptr());
}

static void
enableFileLogging()
{
    static LogSink::ptr sink;
    LogSink::ptr replacement;
    std::string file = g_logFile->val();
    if (!file.empty()) {
        try {
            replacement.reset(new FileLogSink(file));
        } catch (NativeException &) {
            SLUICE_LOG_ERROR(g_log) << "can't log to " << file << ": "
                << boost::current_exception_diagnostic_information();
            return;
        }
    }
    replaceSink(sink, replacement);
}

static int
syslogFacility(const std::string &name)
{
    for (CODE *facility = facilitynames; facility->c_name; ++facility) {
        if (name == facility->c_name)
            return facility->c_val;
    }
    return -1;
}

static void
enableSyslogLogging()
{
    static LogSink::ptr sink;
    int facility = syslogFacility(g_logSyslogFacility->val());
    replaceSink(sink, facility == -1 ? LogSink::ptr() :
        LogSink::ptr(new SyslogLogSink(facility)));
}

namespace {

static struct LogInitializer
{
    LogInitializer()
    {
        const ConfigVar<std::string>::ptr masks[] = { g_logError, g_logWarn,
            g_logInfo, g_logVerbose, g_logDebug, g_logTrace };
        for (size_t i = 0; i < sizeof(masks) / sizeof(masks[0]); ++i) {
            masks[i]->beforeChange.connect(&validMask);
            masks[i]->monitor(&applyMasks);
        }
        g_logStdout->monitor(&enableStdoutLogging);
        g_logFile->monitor(&enableFileLogging);
        g_logSyslogFacility->monitor(&enableSyslogLogging);
        // Loggers looked up before the masks existed
        applyMasks();
    }
} g_init;

}

Logger::ptr
Log::root()
{
    static Logger::ptr root(new Logger(":", Logger::ptr()));
    return root;
}

Logger::ptr
Log::lookup(const std::string &name)
{
    Registry &loggers = registry();
    boost::mutex::scoped_lock lock(loggers.mutex);
    Logger::ptr logger = root();
    size_t start = 0;
    while (start < name.size()) {
        size_t colon = name.find(':', start);
        if (colon == std::string::npos)
            colon = name.size();
        // Empty components ("a::b", ":a") name nothing
        if (colon != start) {
            std::string prefix = name.substr(0, colon);
            Logger::ptr &slot = loggers.loggers[prefix];
            if (!slot) {
                slot.reset(new Logger(prefix, logger));
                if (g_logTrace)
                    slot->m_level = levelFor(prefix);
            }
            logger = slot;
        }
        start = colon + 1;
    }
    return logger;
}

Logger::Logger(const std::string &name, Logger::ptr parent)
    : m_name(name),
      m_parent(parent),
      m_level(Log::INFO)
{}

bool
Logger::enabled(Log::Level level) const
{
    return level == Log::FATAL || (m_level >= level && !f_inSink);
}

void
Logger::log(Log::Level level, const std::string &message, const char *file,
    int line)
{
    if (message.empty() || !enabled(level))
        return;
    // Callers often log right before inspecting errno
    int error = errno;
    std::ostringstream os;
    os << boost::posix_time::microsec_clock::universal_time() << " "
        << TimerManager::now() - g_start << " " << level << " "
        << syscall(SYS_gettid) << " " << Fiber::getThis().get() << " "
        << m_name << " " << (file ? file : "") << ":" << line << " "
        << message << "\n";
    std::string formatted = os.str();
    bool nested = f_inSink;
    f_inSink = true;
    for (const Logger *logger = this; logger; logger = logger->m_parent.get()) {
        for (std::list<LogSink::ptr>::const_iterator it =
            logger->m_sinks.begin(); it != logger->m_sinks.end(); ++it)
            (*it)->log(level, formatted);
    }
    f_inSink = nested;
    errno = error;
}

LogEvent::~LogEvent()
{
    m_logger->log(m_level, m_os.str(), m_file, m_line);
}

std::ostream &
operator <<(std::ostream &os, Log::Level level)
{
    static const char *names[] = { "NONE", "FATAL", "ERROR", "WARN", "INFO",
        "VERBOSE", "DEBUG", "TRACE" };
    SLUICE_ASSERT(level >= Log::NONE && level <= Log::TRACE);
    return os << names[level];
}

}
