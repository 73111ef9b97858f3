// Copyright (c) 2009 - Mozy, Inc.

#include "log.h"

#include <sys/syscall.h>
#include <unistd.h>

#define SYSLOG_NAMES
#include <syslog.h>

#include <algorithm>
#include <iostream>
#include <map>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/regex.hpp>
#include <boost/thread/mutex.hpp>

#include "config.h"
#include "exception.h"
#include "fiber.h"
#include "thread_local_storage.h"
#include "catena/streams/file.h"

namespace Catena {

namespace {

enum { MASK_COUNT = Log::TRACE - Log::ERROR + 1 };

struct LogRegistry
{
    LogRegistry()
        : start(boost::posix_time::microsec_clock::universal_time())
    {
        for (int i = 0; i < MASK_COUNT; ++i)
            masks[i] = boost::regex(Log::ERROR + i <= Log::INFO ? ".*" : "");
    }

    Log::Level levelFor(const std::string &name) const
    {
        Log::Level level = Log::FATAL;
        for (int i = 0; i < MASK_COUNT; ++i) {
            if (boost::regex_match(name, masks[i]))
                level = (Log::Level)(Log::ERROR + i);
        }
        return level;
    }

    boost::mutex mutex;
    std::map<std::string, Logger::ptr> loggers;
    // Indexed from ERROR to TRACE
    boost::regex masks[MASK_COUNT];
    std::vector<LogSink::ptr> sinks;
    boost::posix_time::ptime start;
};

}

// Loggers are looked up from static initializers in every file, so the
// registry must not depend on the initialization order of this one
static LogRegistry &registry()
{
    static LogRegistry registry;
    return registry;
}

static ThreadLocalStorage<bool> t_logDisabled;

static ConfigVar<std::string>::ptr g_masks[MASK_COUNT] = {
    Config::lookup("log.errormask", std::string(".*"),
        "Regex of loggers that log errors"),
    Config::lookup("log.warnmask", std::string(".*"),
        "Regex of loggers that log warnings"),
    Config::lookup("log.infomask", std::string(".*"),
        "Regex of loggers that log info messages"),
    Config::lookup("log.verbosemask", std::string(),
        "Regex of loggers that log verbose messages"),
    Config::lookup("log.debugmask", std::string(),
        "Regex of loggers that log debug messages"),
    Config::lookup("log.tracemask", std::string(),
        "Regex of loggers that log trace messages"),
};
static ConfigVar<bool>::ptr g_logStdout =
    Config::lookup("log.stdout", false, "Log to stdout");
static ConfigVar<std::string>::ptr g_logFile =
    Config::lookup("log.file", std::string(), "Append log to this file");
static ConfigVar<std::string>::ptr g_logSyslog =
    Config::lookup("log.syslogfacility", std::string(),
        "Send log to syslog under this facility (daemon, local0, ...)");

static Logger::ptr g_log = Log::lookup("catena:log");

static void applyMasks()
{
    boost::regex compiled[MASK_COUNT];
    for (int i = 0; i < MASK_COUNT; ++i) {
        try {
            compiled[i] = boost::regex(g_masks[i]->val());
        } catch (boost::regex_error &) {
            compiled[i] = boost::regex(Log::ERROR + i <= Log::INFO ? ".*" : "");
        }
    }
    LogRegistry &reg = registry();
    boost::mutex::scoped_lock lock(reg.mutex);
    std::copy(compiled, compiled + MASK_COUNT, reg.masks);
    for (std::map<std::string, Logger::ptr>::iterator it = reg.loggers.begin();
        it != reg.loggers.end();
        ++it)
        it->second->level(reg.levelFor(it->first));
}

static void applyStdout()
{
    static LogSink::ptr sink;
    if (g_logStdout->val() && !sink) {
        sink.reset(new StdoutLogSink());
        LogSink::add(sink);
    } else if (!g_logStdout->val() && sink) {
        LogSink::remove(sink);
        sink.reset();
    }
}

static void applyFile()
{
    static boost::shared_ptr<FileLogSink> sink;
    const std::string path = g_logFile->val();
    if (sink && sink->path() == path)
        return;
    if (sink) {
        LogSink::remove(sink);
        sink.reset();
    }
    if (path.empty())
        return;
    try {
        sink.reset(new FileLogSink(path));
    } catch (NativeException &) {
        CATENA_LOG_ERROR(g_log) << "unable to log to " << path << ": "
            << boost::current_exception_diagnostic_information();
        return;
    }
    LogSink::add(sink);
}

static void applySyslog()
{
    static boost::shared_ptr<SyslogLogSink> sink;
    int facility = SyslogLogSink::facility(g_logSyslog->val());
    if (sink && sink->facility() == facility)
        return;
    if (sink) {
        LogSink::remove(sink);
        sink.reset();
    }
    if (facility == -1)
        return;
    sink.reset(new SyslogLogSink(facility));
    LogSink::add(sink);
}

namespace {

static struct LogConfigurator
{
    LogConfigurator()
    {
        for (int i = 0; i < MASK_COUNT; ++i)
            g_masks[i]->onChange.connect(&applyMasks);
        applyMasks();
        g_logStdout->monitor(&applyStdout);
        g_logFile->monitor(&applyFile);
        g_logSyslog->monitor(&applySyslog);
    }
} g_configurator;

}

Logger::ptr
Log::lookup(const std::string &name)
{
    LogRegistry &reg = registry();
    boost::mutex::scoped_lock lock(reg.mutex);
    Logger::ptr &logger = reg.loggers[name];
    if (!logger)
        logger.reset(new Logger(name, reg.levelFor(name)));
    return logger;
}

Logger::ptr
Log::root()
{
    return lookup(std::string());
}

void
LogSink::add(LogSink::ptr sink)
{
    LogRegistry &reg = registry();
    boost::mutex::scoped_lock lock(reg.mutex);
    reg.sinks.push_back(sink);
}

void
LogSink::remove(LogSink::ptr sink)
{
    LogRegistry &reg = registry();
    boost::mutex::scoped_lock lock(reg.mutex);
    reg.sinks.erase(std::remove(reg.sinks.begin(), reg.sinks.end(), sink),
        reg.sinks.end());
}

static std::string format(const LogRecord &record)
{
    std::ostringstream os;
    os << boost::posix_time::to_iso_extended_string(record.time) << ' '
        << record.elapsed << ' ' << record.level << ' ' << record.thread
        << ' ' << record.fiber << ' ' << record.logger << ' '
        << (record.file ? record.file : "") << ':' << record.line << ' '
        << record.message << '\n';
    return os.str();
}

void
StdoutLogSink::log(const LogRecord &record)
{
    std::cout << format(record) << std::flush;
}

FileLogSink::FileLogSink(const std::string &path)
    : m_path(path),
      m_stream(new FileStream(path, FileStream::APPEND,
          FileStream::OPEN_OR_CREATE))
{}

void
FileLogSink::log(const LogRecord &record)
{
    std::string line = format(record);
    try {
        m_stream->write(line.c_str(), line.size());
    } catch (NativeException &) {
        // Nowhere left to report it
    }
}

void
SyslogLogSink::log(const LogRecord &record)
{
    int priority = LOG_DEBUG;
    switch (record.level) {
        case Log::FATAL:    priority = LOG_CRIT; break;
        case Log::ERROR:    priority = LOG_ERR; break;
        case Log::WARNING:  priority = LOG_WARNING; break;
        case Log::INFO:     priority = LOG_NOTICE; break;
        case Log::VERBOSE:  priority = LOG_INFO; break;
        default:            break;
    }
    std::string line = format(record);
    syslog(m_facility | priority, "%.*s", (int)line.size(), line.c_str());
}

int
SyslogLogSink::facility(const std::string &name)
{
    if (name.empty())
        return -1;
    for (const CODE *code = facilitynames; code->c_name; ++code) {
        if (name == code->c_name)
            return code->c_val;
    }
    return -1;
}

LogDisabler::LogDisabler()
    : m_wasDisabled(t_logDisabled.get())
{
    t_logDisabled = true;
}

LogDisabler::~LogDisabler()
{
    if (!m_wasDisabled)
        t_logDisabled = false;
}

LogEvent::~LogEvent()
{
    m_logger->log(m_level, m_os.str(), m_file, m_line);
}

bool
Logger::enabled(Log::Level level) const
{
    return level == Log::FATAL || (level <= m_level && !t_logDisabled.get());
}

void
Logger::log(Log::Level level, const std::string &message, const char *file,
    int line)
{
    if (message.empty() || !enabled(level))
        return;
    // Sinks may clobber errno
    error_t error = lastError();
    LogDisabler disabler;

    LogRecord record;
    std::vector<LogSink::ptr> sinks;
    {
        LogRegistry &reg = registry();
        boost::mutex::scoped_lock lock(reg.mutex);
        if (reg.sinks.empty()) {
            lastError(error);
            return;
        }
        sinks = reg.sinks;
        record.time = boost::posix_time::microsec_clock::universal_time();
        record.elapsed = (record.time - reg.start).total_microseconds();
    }
    record.logger = m_name;
    record.thread = (pid_t)syscall(SYS_gettid);
    record.fiber = Fiber::getThis().get();
    record.level = level;
    record.message = message;
    record.file = file;
    record.line = line;
    for (size_t i = 0; i < sinks.size(); ++i)
        sinks[i]->log(record);
    lastError(error);
}

static const char *g_levelNames[] = {
    "NONE",
    "FATAL",
    "ERROR",
    "WARN",
    "INFO",
    "VERBOSE",
    "DEBUG",
    "TRACE",
};

std::ostream &
operator <<(std::ostream &os, Log::Level level)
{
    if (level < Log::NONE || level > Log::TRACE)
        return os << (int)level;
    return os << g_levelNames[level];
}

}
