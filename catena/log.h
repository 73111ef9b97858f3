#ifndef __CATENA_LOG_H__
#define __CATENA_LOG_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "version.h"

#include <sys/types.h>

#include <sstream>
#include <string>

#include <boost/date_time/posix_time/ptime.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

namespace Catena {

class Logger;
class Stream;

/// Named Loggers plus the sinks every message ends up in
///
/// Logger names are ':' separated ("catena:streams:concatenated").  The
/// level of each Logger comes from the log.*mask ConfigVars: regular
/// expressions matched against the full name, where the most verbose
/// matching mask wins.
/// @sa LogMacros
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

    /// Find the Logger called @c name, creating it on first use
    static boost::shared_ptr<Logger> lookup(const std::string &name);
    /// The Logger with the empty name
    static boost::shared_ptr<Logger> root();
};

/// Everything known about one message
struct LogRecord
{
    std::string logger;
    boost::posix_time::ptime time;
    /// Microseconds since the first message of the process
    unsigned long long elapsed;
    pid_t thread;
    const void *fiber;
    Log::Level level;
    std::string message;
    const char *file;
    int line;
};

/// Receives every message that passes its Logger's level
class LogSink : boost::noncopyable
{
public:
    typedef boost::shared_ptr<LogSink> ptr;

    virtual ~LogSink() {}

    /// Called with logging disabled on this thread; must not throw
    virtual void log(const LogRecord &record) = 0;

    /// Attach or detach a sink; every Logger writes to every attached sink
    static void add(LogSink::ptr sink);
    static void remove(LogSink::ptr sink);
};

/// Writes to std::cout
class StdoutLogSink : public LogSink
{
public:
    void log(const LogRecord &record);
};

/// Forwards to syslog(3) under a fixed facility
class SyslogLogSink : public LogSink
{
public:
    SyslogLogSink(int facility)
        : m_facility(facility)
    {}

    void log(const LogRecord &record);

    int facility() const { return m_facility; }

    /// @return The LOG_* value for a name such as "daemon" or "local0", or
    /// -1 if there is no such facility
    static int facility(const std::string &name);

private:
    int m_facility;
};

/// Appends to a file, creating it if needed
class FileLogSink : public LogSink
{
public:
    FileLogSink(const std::string &path);

    void log(const LogRecord &record);

    const std::string &path() const { return m_path; }

private:
    std::string m_path;
    boost::shared_ptr<Stream> m_stream;
};

/// Collects one streamed message, and hands it to the Logger when it goes
/// out of scope
class LogEvent
{
public:
    LogEvent(boost::shared_ptr<Logger> logger, Log::Level level,
        const char *file, int line)
        : m_logger(logger),
          m_level(level),
          m_file(file),
          m_line(line)
    {}
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

/// Suppresses all logging on this thread while in scope
class LogDisabler : boost::noncopyable
{
public:
    LogDisabler();
    ~LogDisabler();

private:
    bool m_wasDisabled;
};

class Logger : public boost::enable_shared_from_this<Logger>,
    boost::noncopyable
{
public:
    typedef boost::shared_ptr<Logger> ptr;

    Logger(const std::string &name, Log::Level level)
        : m_name(name),
          m_level(level)
    {}

    const std::string &name() const { return m_name; }
    Log::Level level() const { return m_level; }
    /// Overrides the level until the masks next change
    void level(Log::Level level) { m_level = level; }

    /// FATAL is always enabled
    bool enabled(Log::Level level) const;

    LogEvent log(Log::Level level, const char *file = NULL, int line = -1)
    { return LogEvent(shared_from_this(), level, file, line); }
    void log(Log::Level level, const std::string &message,
        const char *file = NULL, int line = -1);

private:
    std::string m_name;
    volatile Log::Level m_level;
};

/// @defgroup LogMacros Logging Macros
/// Capture the file and line and yield a std::ostream & for the message.
/// Nothing after the macro is evaluated unless the Logger is enabled at
/// that level.
/// @{
#define CATENA_LOG_LEVEL(lg, level) if ((lg)->enabled(level))                 \
    (lg)->log(level, __FILE__, __LINE__).os()
#define CATENA_LOG_FATAL(lg) CATENA_LOG_LEVEL(lg, ::Catena::Log::FATAL)
#define CATENA_LOG_ERROR(lg) CATENA_LOG_LEVEL(lg, ::Catena::Log::ERROR)
#define CATENA_LOG_WARNING(lg) CATENA_LOG_LEVEL(lg, ::Catena::Log::WARNING)
#define CATENA_LOG_INFO(lg) CATENA_LOG_LEVEL(lg, ::Catena::Log::INFO)
#define CATENA_LOG_VERBOSE(lg) CATENA_LOG_LEVEL(lg, ::Catena::Log::VERBOSE)
#define CATENA_LOG_DEBUG(lg) CATENA_LOG_LEVEL(lg, ::Catena::Log::DEBUG)
#define CATENA_LOG_TRACE(lg) CATENA_LOG_LEVEL(lg, ::Catena::Log::TRACE)
/// @}

std::ostream &operator <<(std::ostream &os, Log::Level level);

}

#endif
