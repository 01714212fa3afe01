// Copyright (c) 2009 - Mozy, Inc.

#include "log.h"

#include <iostream>
#include <map>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/regex.hpp>
#include <boost/thread/mutex.hpp>

#include "config.h"

namespace MockIO {

namespace {

struct LevelMask
{
    Log::Level level;
    const char *name;
    const char *defaultValue;
    const char *description;
};

}

// Least to most verbose; a later match overrides an earlier one
static const LevelMask g_levelMasks[] = {
    { Log::ERROR, "log.errormask", ".*", "Regex of loggers to enable error for." },
    { Log::WARNING, "log.warnmask", ".*", "Regex of loggers to enable warning for." },
    { Log::INFO, "log.infomask", ".*", "Regex of loggers to enable info for." },
    { Log::VERBOSE, "log.verbosemask", "", "Regex of loggers to enable verbose for." },
    { Log::DEBUG, "log.debugmask", "", "Regex of loggers to enable debugging for." },
    { Log::TRACE, "log.tracemask", "", "Regex of loggers to enable trace for." },
};
static const size_t g_levelMaskCount =
    sizeof(g_levelMasks) / sizeof(g_levelMasks[0]);

static std::vector<ConfigVar<std::string>::ptr> g_maskVars;
static ConfigVar<bool>::ptr g_logStdout;
// Zero until the ConfigVars above exist; Loggers looked up earlier (from
// other translation units' static initializers) keep the default level
static bool g_masksReady;
static boost::posix_time::ptime g_start;

typedef std::map<std::string, Logger::ptr> LoggerMap;

static boost::mutex &registryMutex()
{
    static boost::mutex mutex;
    return mutex;
}

static LoggerMap &registry()
{
    static LoggerMap loggers;
    return loggers;
}

static boost::regex compileMask(const LevelMask &mask,
    const std::string &expression)
{
    try {
        return boost::regex(expression);
    } catch (boost::regex_error &) {
        return boost::regex(mask.defaultValue);
    }
}

static void applyMasks(Logger &logger, const std::vector<boost::regex> &masks)
{
    Log::Level level = Log::FATAL;
    for (size_t i = 0; i < masks.size(); ++i) {
        if (boost::regex_match(logger.name(), masks[i]))
            level = g_levelMasks[i].level;
    }
    logger.level(level);
}

static std::vector<boost::regex> currentMasks()
{
    std::vector<boost::regex> masks;
    for (size_t i = 0; i < g_maskVars.size(); ++i)
        masks.push_back(compileMask(g_levelMasks[i], g_maskVars[i]->val()));
    return masks;
}

static void updateLevels()
{
    std::vector<boost::regex> masks = currentMasks();
    boost::mutex::scoped_lock lock(registryMutex());
    for (LoggerMap::iterator it = registry().begin();
        it != registry().end();
        ++it)
        applyMasks(*it->second, masks);
    applyMasks(*Log::root(), masks);
}

static void updateStdoutSink()
{
    static LogSink::ptr sink;
    if (g_logStdout->val() && !sink) {
        sink.reset(new StdoutLogSink());
        Log::root()->addSink(sink);
    } else if (!g_logStdout->val() && sink) {
        Log::root()->removeSink(sink);
        sink.reset();
    }
}

namespace {

static struct LogInitializer
{
    LogInitializer()
    {
        g_start = boost::posix_time::microsec_clock::universal_time();
        for (size_t i = 0; i < g_levelMaskCount; ++i) {
            const LevelMask &mask = g_levelMasks[i];
            g_maskVars.push_back(Config::lookup(mask.name,
                std::string(mask.defaultValue), mask.description));
            g_maskVars.back()->onChange.connect(&updateLevels);
        }
        g_logStdout = Config::lookup("log.stdout", false,
            "Print log records on stdout");
        g_logStdout->onChange.connect(&updateStdoutSink);
        g_masksReady = true;
    }
} g_init;

}

Logger::ptr
Log::root()
{
    static Logger::ptr s_root(new Logger(std::string(), Logger::ptr()));
    return s_root;
}

Logger::ptr
Log::lookup(const std::string &name)
{
    Logger::ptr logger = root();
    boost::mutex::scoped_lock lock(registryMutex());
    // Walk "a", "a:b", "a:b:c", creating whatever is missing
    std::string::size_type colon = 0;
    while (!name.empty() && colon != std::string::npos) {
        colon = name.find(':', colon + 1);
        std::string prefix = name.substr(0, colon);
        LoggerMap::iterator it = registry().find(prefix);
        if (it == registry().end()) {
            Logger::ptr child(new Logger(prefix, logger));
            if (g_masksReady)
                applyMasks(*child, currentMasks());
            it = registry().insert(std::make_pair(prefix, child)).first;
        }
        logger = it->second;
    }
    return logger;
}

void
StdoutLogSink::log(const std::string &logger,
    boost::posix_time::ptime now, unsigned long long elapsed,
    boost::thread::id thread, Log::Level level, const std::string &str,
    const char *file, int line)
{
    // Built up front so that records from different threads don't interleave
    std::ostringstream os;
    os << now << " " << elapsed << " " << level << " " << thread << " "
        << logger << " " << (file ? file : "") << ":" << line << " "
        << str << "\n";
    std::cout << os.str() << std::flush;
}

LogEvent::LogEvent(Logger::ptr logger, Log::Level level, const char *file,
    int line)
    : m_logger(logger),
      m_level(level),
      m_file(file),
      m_line(line)
{}

LogEvent::LogEvent(const LogEvent &copy)
    : m_logger(copy.m_logger),
      m_level(copy.m_level),
      m_file(copy.m_file),
      m_line(copy.m_line)
{}

LogEvent::~LogEvent()
{
    m_logger->log(m_level, m_os.str(), m_file, m_line);
}

Logger::Logger(const std::string &name, Logger::ptr parent)
    : m_name(name),
      m_parent(parent),
      m_level(Log::INFO)
{}

void
Logger::addSink(LogSink::ptr sink)
{
    m_sinks.push_back(sink);
}

void
Logger::removeSink(LogSink::ptr sink)
{
    m_sinks.remove(sink);
}

void
Logger::log(Log::Level level, const std::string &str, const char *file,
    int line)
{
    if (str.empty() || !enabled(level))
        return;
    boost::posix_time::ptime now =
        boost::posix_time::microsec_clock::universal_time();
    unsigned long long elapsed = (now - g_start).total_microseconds();
    boost::thread::id thread = boost::this_thread::get_id();
    for (Logger *logger = this; logger; logger = logger->m_parent.get()) {
        for (std::list<LogSink::ptr>::const_iterator it = logger->m_sinks.begin();
            it != logger->m_sinks.end();
            ++it)
            (*it)->log(m_name, now, elapsed, thread, level, str, file, line);
    }
}

std::ostream &operator <<(std::ostream &os, Log::Level level)
{
    static const char *names[] = {
        "NONE", "FATAL", "ERROR", "WARN", "INFO", "VERBOSE", "DEBUG", "TRACE"
    };
    return os << names[level];
}

}
