#ifndef __SLUICE_LOG_H__
#define __SLUICE_LOG_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <list>
#include <sstream>

#include <boost/enable_shared_from_this.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>


namespace Sluice {

class Logger;

/// Registry of named Loggers
///
/// Names are colon separated paths ("sluice:http:server"); every prefix is
/// the parent Logger, up to the root. A message goes to the sinks of its
/// Logger and of every ancestor. Levels come from the log.*mask ConfigVars,
/// each a regex over Logger names, and are re-applied whenever one changes.
class Log : boost::noncopyable
{
public:
    enum Level {
        NONE,
        FATAL,
        ERROR,
        WARNING,
        INFO,
        VERBOSE,
        DEBUG,
        TRACE
    };

    static boost::shared_ptr<Logger> root();
    /// Find or create the Logger called name
    static boost::shared_ptr<Logger> lookup(const std::string &name);

private:
    Log();
};

/// Receives each formatted log line
class LogSink
{
public:
    typedef boost::shared_ptr<LogSink> ptr;

    virtual ~LogSink() {}
    /// @param line "<utc time> <elapsed us> <LEVEL> <thread> <fiber>
    /// <logger> <file>:<line> <message>\n"
    virtual void log(Log::Level level, const std::string &line) = 0;
};

/// Collects one message from the logging macros, and logs it when destroyed
class LogEvent
{
    friend class Logger;
private:
    LogEvent(boost::shared_ptr<Logger> logger, Log::Level level,
        const char *file, int line)
        : m_logger(logger),
          m_level(level),
          m_file(file),
          m_line(line)
    {}

public:
    // Only ever copied out of Logger::log, before anything is streamed
    LogEvent(const LogEvent &copy)
        : m_logger(copy.m_logger),
          m_level(copy.m_level),
          m_file(copy.m_file),
          m_line(copy.m_line)
    {}
    ~LogEvent();

    std::ostream &os() { return m_os; }

private:
    boost::shared_ptr<Logger> m_logger;
    Log::Level m_level;
    const char *m_file;
    int m_line;
    std::ostringstream m_os;
};

class Logger : public boost::enable_shared_from_this<Logger>, boost::noncopyable
{
    friend class Log;
public:
    typedef boost::shared_ptr<Logger> ptr;

    bool enabled(Log::Level level) const;
    Log::Level level() const { return m_level; }
    void level(Log::Level level) { m_level = level; }

    void addSink(LogSink::ptr sink) { m_sinks.push_back(sink); }
    void removeSink(LogSink::ptr sink) { m_sinks.remove(sink); }

    LogEvent log(Log::Level level, const char *file = NULL, int line = 0)
    { return LogEvent(shared_from_this(), level, file, line); }
    void log(Log::Level level, const std::string &message,
        const char *file = NULL, int line = 0);

    const std::string &name() const { return m_name; }

private:
    Logger(const std::string &name, Logger::ptr parent);

private:
    std::string m_name;
    Logger::ptr m_parent;
    Log::Level m_level;
    std::list<LogSink::ptr> m_sinks;
};

/// @defgroup LogMacros Logging Macros
/// Each yields a std::ostream & inside an unscoped if, so nothing after the
/// macro is evaluated unless the Logger is enabled at that level.
/// @{
#define SLUICE_LOG_LEVEL(lg, level) if ((lg)->enabled(level))                   \
    (lg)->log(level, __FILE__, __LINE__).os()
#define SLUICE_LOG_FATAL(log) SLUICE_LOG_LEVEL(log, ::Sluice::Log::FATAL)
#define SLUICE_LOG_ERROR(log) SLUICE_LOG_LEVEL(log, ::Sluice::Log::ERROR)
#define SLUICE_LOG_WARNING(log) SLUICE_LOG_LEVEL(log, ::Sluice::Log::WARNING)
#define SLUICE_LOG_INFO(log) SLUICE_LOG_LEVEL(log, ::Sluice::Log::INFO)
#define SLUICE_LOG_VERBOSE(log) SLUICE_LOG_LEVEL(log, ::Sluice::Log::VERBOSE)
#define SLUICE_LOG_DEBUG(log) SLUICE_LOG_LEVEL(log, ::Sluice::Log::DEBUG)
#define SLUICE_LOG_TRACE(log) SLUICE_LOG_LEVEL(log, ::Sluice::Log::TRACE)
/// @}

std::ostream &operator <<(std::ostream &os, Log::Level level);

}

#endif
