// Copyright (c) 2009 - Mozy, Inc.

#include "config.h"

#include <algorithm>
#include <ctype.h>
#include <string.h>

#ifdef OSX
#include <crt_externs.h>
#elif !defined(WINDOWS)
extern char **environ;
#endif

namespace MockIO {

static Logger::ptr g_log = Log::lookup("mockio:config");

Config::ConfigVarSet &
Config::vars()
{
    static ConfigVarSet s_vars;
    return s_vars;
}

bool
Config::isValidName(const std::string &name)
{
    return !name.empty() &&
        name.find_first_not_of("abcdefghijklmnopqrstuvwxyz.") ==
        std::string::npos;
}

ConfigVarBase::ptr
Config::lookup(const std::string &name)
{
    ConfigVarSet::iterator it = vars().find(name);
    return it == vars().end() ? ConfigVarBase::ptr() : *it;
}

void
Config::loadFromCommandLine(int &argc, char *argv[])
{
    if (argc <= 1)
        return;
    int kept = 1;
    int i = 1;
    for (; i < argc; ++i) {
        const char *arg = argv[i];
        if (strcmp(arg, "--") == 0)
            break;
        if (strncmp(arg, "--", 2) != 0) {
            argv[kept++] = argv[i];
            continue;
        }
        std::string name(arg + 2);
        std::string value;
        std::string::size_type equals = name.find('=');
        if (equals != std::string::npos) {
            value = name.substr(equals + 1);
            name.resize(equals);
        }
        ConfigVarBase::ptr var = lookup(name);
        if (!var) {
            argv[kept++] = argv[i];
            continue;
        }
        if (equals == std::string::npos) {
            if (i + 1 == argc)
                MOCKIO_THROW_EXCEPTION(std::invalid_argument(name));
            value = argv[++i];
        }
        if (!var->fromString(value))
            MOCKIO_THROW_EXCEPTION(std::invalid_argument(name));
        MOCKIO_LOG_VERBOSE(g_log) << "--" << name << " = " << var->toString();
    }
    // Everything from "--" on is passed through untouched
    for (; i < argc; ++i)
        argv[kept++] = argv[i];
    argc = kept;
}

static void loadFromEnvironmentEntry(const char *entry)
{
    const char *equals = strchr(entry, '=');
    if (!equals || equals == entry)
        return;
    std::string name(entry, equals - entry);
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);
    std::replace(name.begin(), name.end(), '_', '.');
    if (!Config::isValidName(name))
        return;
    ConfigVarBase::ptr var = Config::lookup(name);
    if (!var)
        return;
    if (var->fromString(equals + 1))
        MOCKIO_LOG_VERBOSE(g_log) << name << " = " << var->toString();
    else
        MOCKIO_LOG_WARNING(g_log) << "Rejected " << name << " = " << equals + 1;
}

void
Config::loadFromEnvironment()
{
#ifdef WINDOWS
    char *block = GetEnvironmentStringsA();
    if (!block)
        return;
    for (const char *entry = block; *entry; entry += strlen(entry) + 1)
        loadFromEnvironmentEntry(entry);
    FreeEnvironmentStringsA(block);
#else
#ifdef OSX
    char **environ = *_NSGetEnviron();
#endif
    for (char **entry = environ; entry && *entry; ++entry)
        loadFromEnvironmentEntry(*entry);
#endif
}

ScopedConfigVar::ScopedConfigVar(const std::string &name,
    const std::string &value)
    : m_var(Config::lookup(name))
{
    if (!m_var)
        MOCKIO_THROW_EXCEPTION(std::invalid_argument(name));
    m_previous = m_var->toString();
    if (!m_var->fromString(value)) {
        m_var.reset();
        MOCKIO_THROW_EXCEPTION(std::invalid_argument(name));
    }
}

void
ScopedConfigVar::reset()
{
    if (!m_var)
        return;
    MOCKIO_VERIFY(m_var->fromString(m_previous));
    m_var.reset();
}

}
