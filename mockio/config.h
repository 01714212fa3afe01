#ifndef __MOCKIO_CONFIG_H__
#define __MOCKIO_CONFIG_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <stdexcept>
#include <string>

#include <boost/lexical_cast.hpp>
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/mem_fun.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/signals2/signal.hpp>

#include "assert.h"

namespace MockIO {

/// A named runtime setting
///
/// The log level masks (log.debugmask and friends) and the test runner's
/// switches are ConfigVars.  Names use lower case letters and '.' only.
/// Values arrive as strings, from Config::loadFromCommandLine(),
/// Config::loadFromEnvironment() or ScopedConfigVar.
class ConfigVarBase : boost::noncopyable
{
public:
    typedef boost::shared_ptr<ConfigVarBase> ptr;

public:
    ConfigVarBase(const std::string &name, const std::string &description)
        : m_name(name),
          m_description(description)
    {}
    virtual ~ConfigVarBase() {}

    const std::string &name() const { return m_name; }
    const std::string &description() const { return m_description; }

    virtual std::string toString() const = 0;
    /// @return false (leaving the value alone) if str doesn't parse
    virtual bool fromString(const std::string &str) = 0;

    /// Fired after every change of value; slots must not throw
    boost::signals2::signal<void ()> onChange;

private:
    std::string m_name, m_description;
};

template <class T>
class ConfigVar : public ConfigVarBase
{
public:
    typedef boost::shared_ptr<ConfigVar> ptr;

public:
    ConfigVar(const std::string &name, const T &defaultValue,
        const std::string &description)
        : ConfigVarBase(name, description),
          m_val(defaultValue)
    {}

    T val() const { return m_val; }
    void val(const T &v)
    {
        if (m_val == v)
            return;
        m_val = v;
        onChange();
    }

    std::string toString() const
    { return boost::lexical_cast<std::string>(m_val); }

    bool fromString(const std::string &str)
    {
        T v;
        try {
            v = boost::lexical_cast<T>(str);
        } catch (boost::bad_lexical_cast &) {
            return false;
        }
        val(v);
        return true;
    }

private:
    T m_val;
};

class Config
{
public:
    /// Declare a ConfigVar; each name may be declared once
    /// @throws std::invalid_argument if name has anything besides lower case
    /// letters and '.'
    template <class T>
    static typename ConfigVar<T>::ptr lookup(const std::string &name,
        const T &defaultValue, const std::string &description = "")
    {
        if (!isValidName(name))
            MOCKIO_THROW_EXCEPTION(std::invalid_argument(name));
        typename ConfigVar<T>::ptr var(new ConfigVar<T>(name, defaultValue,
            description));
        MOCKIO_VERIFY(vars().insert(var).second);
        return var;
    }

    /// @return The ConfigVar declared as name, or NULL
    static ConfigVarBase::ptr lookup(const std::string &name);

    /// Consume "--name=value" and "--name value" arguments naming a declared
    /// ConfigVar, removing them from argv.  argv[0] and anything after a "--"
    /// argument are left alone, as are arguments that don't name a ConfigVar.
    /// @throws std::invalid_argument (what() is the name) if the value is
    /// missing or doesn't parse
    static void loadFromCommandLine(int &argc, char *argv[]);
    /// Environment variable names are matched case insensitively, with '_'
    /// standing in for '.'; values that don't parse are logged and skipped
    static void loadFromEnvironment();

    static bool isValidName(const std::string &name);

private:
    typedef boost::multi_index_container<
        ConfigVarBase::ptr,
        boost::multi_index::indexed_by<
            boost::multi_index::ordered_unique<
                boost::multi_index::const_mem_fun<ConfigVarBase,
                    const std::string &, &ConfigVarBase::name> >
        >
    > ConfigVarSet;

    static ConfigVarSet &vars();
};

/// Sets a ConfigVar for the lifetime of this object
class ScopedConfigVar : boost::noncopyable
{
public:
    /// @throws std::invalid_argument if name isn't declared or value doesn't
    /// parse
    ScopedConfigVar(const std::string &name, const std::string &value);
    ~ScopedConfigVar() { reset(); }

    /// Put the previous value back now instead of at destruction
    void reset();

private:
    ConfigVarBase::ptr m_var;
    std::string m_previous;
};

}

#endif
