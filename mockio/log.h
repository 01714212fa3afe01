#ifndef __MOCKIO_LOG_H__
#define __MOCKIO_LOG_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <list>
#include <sstream>
#include <string>

#include <boost/date_time/posix_time/ptime.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/thread.hpp>

#include "version.h"

namespace MockIO {

class Logger;

/// Named Loggers for the streams and the test runner
///
/// Names are ':' separated; "mockio:streams:mock" hands its messages to the
/// sinks of "mockio:streams", "mockio" and the root Logger as well as its
/// own.  Which levels each Logger emits is decided by the log.*mask
/// ConfigVars, each a regex matched against the full Logger name; the most
/// verbose matching mask wins.  Nothing is printed unless a LogSink is
/// attached, either directly or by setting log.stdout.
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

    /// Find the Logger called name, creating it (and its ancestors) if needed
    static boost::shared_ptr<Logger> lookup(const std::string &name);
    static boost::shared_ptr<Logger> root();

private:
    Log();
};

/// Destination for formatted log records
class LogSink
{
public:
    typedef boost::shared_ptr<LogSink> ptr;

public:
    virtual ~LogSink() {}

    /// @param elapsed Microseconds since logging was initialized
    virtual void log(const std::string &logger,
        boost::posix_time::ptime now, unsigned long long elapsed,
        boost::thread::id thread, Log::Level level, const std::string &str,
        const char *file, int line) = 0;
};

/// One line per record on std::cout
class StdoutLogSink : public LogSink
{
public:
    void log(const std::string &logger,
        boost::posix_time::ptime now, unsigned long long elapsed,
        boost::thread::id thread, Log::Level level, const std::string &str,
        const char *file, int line);
};

/// Collects one record from the MOCKIO_LOG_* macros; submitted to the Logger
/// when it goes out of scope
class LogEvent
{
    friend class Logger;
private:
    LogEvent(boost::shared_ptr<Logger> logger, Log::Level level,
        const char *file, int line);

public:
    LogEvent(const LogEvent &copy);
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

private:
    Logger(const std::string &name, Logger::ptr parent);

public:
    const std::string &name() const { return m_name; }

    /// FATAL is always enabled
    bool enabled(Log::Level level) const
    { return level == Log::FATAL || level <= m_level; }
    Log::Level level() const { return m_level; }
    /// Overridden again the next time a log.*mask ConfigVar changes
    void level(Log::Level level) { m_level = level; }

    void addSink(LogSink::ptr sink);
    void removeSink(LogSink::ptr sink);

    LogEvent log(Log::Level level, const char *file = NULL, int line = -1)
    { return LogEvent(shared_from_this(), level, file, line); }
    /// Deliver str to the sinks of this Logger and all of its ancestors
    void log(Log::Level level, const std::string &str,
        const char *file = NULL, int line = -1);

private:
    std::string m_name;
    Logger::ptr m_parent;
    Log::Level m_level;
    std::list<LogSink::ptr> m_sinks;
};

/// The whole statement is skipped when lg is not enabled at level
#define MOCKIO_LOG_LEVEL(lg, level) if ((lg)->enabled(level))                   \
    (lg)->log(level, __FILE__, __LINE__).os()
#define MOCKIO_LOG_FATAL(lg) MOCKIO_LOG_LEVEL(lg, ::MockIO::Log::FATAL)
#define MOCKIO_LOG_ERROR(lg) MOCKIO_LOG_LEVEL(lg, ::MockIO::Log::ERROR)
#define MOCKIO_LOG_WARNING(lg) MOCKIO_LOG_LEVEL(lg, ::MockIO::Log::WARNING)
#define MOCKIO_LOG_INFO(lg) MOCKIO_LOG_LEVEL(lg, ::MockIO::Log::INFO)
#define MOCKIO_LOG_VERBOSE(lg) MOCKIO_LOG_LEVEL(lg, ::MockIO::Log::VERBOSE)
#define MOCKIO_LOG_DEBUG(lg) MOCKIO_LOG_LEVEL(lg, ::MockIO::Log::DEBUG)
#define MOCKIO_LOG_TRACE(lg) MOCKIO_LOG_LEVEL(lg, ::MockIO::Log::TRACE)

std::ostream &operator <<(std::ostream &os, Log::Level level);

}

#endif
