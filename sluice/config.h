#ifndef __SLUICE_CONFIG_H__
#define __SLUICE_CONFIG_H__
// Copyright (c) 2009 - Mozy, Inc.


#include <string>

#include <boost/function.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/mem_fun.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/signals2/signal.hpp>

#include "assert.h"

namespace Sluice {

// Every tunable (storage root, listen address, chunk size, timeouts, log
// masks) is a ConfigVar, declared once at namespace scope by the file that
// owns it:
//
// static ConfigVar<std::string>::ptr g_root =
//     Config::lookup<std::string>("sluice.root", ".", "Directory to serve");
//
// Names are lower case letters and dots. SLUICE_ROOT in the environment and
// --sluice.root on the command line both set sluice.root.

/// The type-erased face of a ConfigVar, read and written as a string
class ConfigVarBase : boost::noncopyable
{
public:
    typedef boost::shared_ptr<ConfigVarBase> ptr;

    ConfigVarBase(const std::string &name, const std::string &description)
        : m_name(name),
          m_description(description)
    {}
    virtual ~ConfigVarBase() {}

    const std::string &name() const { return m_name; }
    const std::string &description() const { return m_description; }

    /// dg runs after every accepted change; it must not throw
    void monitor(boost::function<void ()> dg) { m_changed.connect(dg); }

    virtual std::string toString() const = 0;
    /// @return false if str does not convert, or a validator refused it
    virtual bool fromString(const std::string &str) = 0;

protected:
    boost::signals2::signal<void ()> m_changed;

private:
    std::string m_name, m_description;
};

template <class T>
class ConfigVar : public ConfigVarBase
{
private:
    // Any slot returning false (or throwing) vetoes the change
    struct AllApprove
    {
        typedef bool result_type;
        template <class InputIterator>
        bool operator()(InputIterator first, InputIterator last) const
        {
            try {
                for (; first != last; ++first)
                    if (!*first)
                        return false;
            } catch (std::exception &) {
                return false;
            }
            return true;
        }
    };

public:
    typedef boost::shared_ptr<ConfigVar> ptr;

    ConfigVar(const std::string &name, const T &defaultValue,
        const std::string &description)
        : ConfigVarBase(name, description),
          m_val(defaultValue)
    {}

    /// Validators; see AllApprove
    boost::signals2::signal<bool (const T &), AllApprove> beforeChange;

    T val() const { return m_val; }
    /// @return If v was accepted (setting the current value always is)
    bool val(const T &v)
    {
        if (v == m_val)
            return true;
        if (!beforeChange(v))
            return false;
        m_val = v;
        m_changed();
        return true;
    }

    std::string toString() const
    {
        return boost::lexical_cast<std::string>(m_val);
    }

    bool fromString(const std::string &str)
    {
        T v;
        try {
            v = boost::lexical_cast<T>(str);
        } catch (boost::bad_lexical_cast &) {
            return false;
        }
        return val(v);
    }

private:
    T m_val;
};

class Config
{
public:
    /// Declare a ConfigVar; each name may be declared once
    /// @throws std::invalid_argument what() is name, if it has characters
    /// other than lower case letters and dots
    template <class T>
    static typename ConfigVar<T>::ptr lookup(const std::string &name,
        const T &defaultValue, const std::string &description = "")
    {
        checkName(name);
        typename ConfigVar<T>::ptr result(new ConfigVar<T>(name,
            defaultValue, description));
        SLUICE_ASSERT(vars().insert(result).second);
        return result;
    }

    /// @return The ConfigVar declared as name, or NULL
    static ConfigVarBase::ptr lookup(const std::string &name);

    /// Apply --name=value and --name value arguments, removing them from
    /// argv; argv[0] and everything after a bare -- are left alone
    /// @throws std::invalid_argument what() is the name, if a value is
    /// missing or rejected
    static void loadFromCommandLine(int &argc, char *argv[]);

    /// Apply every environment variable that names a ConfigVar once lower
    /// cased with '_' read as '.'; rejected values are logged and skipped
    static void loadFromEnvironment();

private:
    typedef boost::multi_index_container<
        ConfigVarBase::ptr,
        boost::multi_index::indexed_by<
            boost::multi_index::ordered_unique<
                boost::multi_index::const_mem_fun<ConfigVarBase,
                    const std::string &, &ConfigVarBase::name> >
        >
    > ConfigVarSet;

    static void checkName(const std::string &name);
    static ConfigVarSet &vars();
};

}

#endif
