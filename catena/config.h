#ifndef __CATENA_CONFIG_H__
#define __CATENA_CONFIG_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "version.h"

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

namespace Catena {

// Runtime tunables.  Each ConfigVar is declared once, usually as a static in
// the source file that reads it:
//
//   static ConfigVar<size_t>::ptr g_chunkSize =
//       Config::lookup<size_t>("stream.readline.chunksize", 4096u,
//       "Bytes read ahead per step when looking for a line end");
//
// Names are lower case letters and dots.  main() may then override them with
// Config::loadFromEnvironment() (STREAM_READLINE_CHUNKSIZE=...) and
// Config::loadFromCommandLine() (--stream.readline.chunksize=...).

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

    virtual std::string toString() const = 0;
    /// @return false if the string did not parse or the value was vetoed
    virtual bool fromString(const std::string &value) = 0;

    /// Fires after every accepted change; slots must not throw
    boost::signals2::signal<void ()> onChange;
    /// Call @c dg now, and again after every change
    void monitor(boost::function<void ()> dg)
    {
        dg();
        onChange.connect(dg);
    }

private:
    std::string m_name, m_description;
};

template <class T>
class ConfigVar : public ConfigVarBase
{
public:
    typedef boost::shared_ptr<ConfigVar> ptr;

    /// A change goes ahead only if no beforeChange slot returns false or
    /// throws
    struct Unanimous
    {
        typedef bool result_type;

        template <class InputIterator>
        bool operator()(InputIterator first, InputIterator last) const
        {
            for (; first != last; ++first) {
                try {
                    if (!*first)
                        return false;
                } catch (std::exception &) {
                    return false;
                }
            }
            return true;
        }
    };

    ConfigVar(const std::string &name, const T &defaultValue,
        const std::string &description)
        : ConfigVarBase(name, description),
          m_value(defaultValue)
    {}

    T val() const { return m_value; }
    /// @return false if a beforeChange slot vetoed the value
    bool val(const T &value)
    {
        if (value == m_value)
            return true;
        if (!beforeChange(value))
            return false;
        m_value = value;
        onValueChange(value);
        ConfigVarBase::onChange();
        return true;
    }

    std::string toString() const
    { return boost::lexical_cast<std::string>(m_value); }

    bool fromString(const std::string &value)
    {
        T parsed;
        try {
            parsed = boost::lexical_cast<T>(value);
        } catch (boost::bad_lexical_cast &) {
            return false;
        }
        return val(parsed);
    }

    boost::signals2::signal<bool (const T &), Unanimous> beforeChange;
    /// Typed counterpart of ConfigVarBase::onChange
    boost::signals2::signal<void (const T &)> onValueChange;

private:
    T m_value;
};

class Config
{
public:
    /// @brief Declare a ConfigVar
    /// @exception std::invalid_argument The name has characters other than
    /// lower case letters and dots
    /// @pre No ConfigVar called @c name exists yet
    template <class T>
    static typename ConfigVar<T>::ptr lookup(const std::string &name,
        const T &defaultValue, const std::string &description = "")
    {
        if (!isValidName(name))
            CATENA_THROW_EXCEPTION(std::invalid_argument(name));
        typename ConfigVar<T>::ptr var(new ConfigVar<T>(name, defaultValue,
            description));
        bool inserted = vars().insert(var).second;
        CATENA_ASSERT(inserted);
        (void)inserted;
        return var;
    }

    /// @return The ConfigVar called @c name, or NULL
    static ConfigVarBase::ptr lookup(const std::string &name);

    /// @brief Apply and remove --name=value and --name value arguments
    /// @details
    /// argv[0] is left alone, as is everything after a bare "--" and any
    /// argument that does not name a ConfigVar.
    /// @exception std::invalid_argument what() is the name of a ConfigVar
    /// whose value is missing or was rejected
    static void loadFromCommandLine(int &argc, char *argv[]);

    /// @brief Apply NAME_WITH_UNDERSCORES=value environment variables
    /// @details Values that are rejected are logged and skipped.
    static void loadFromEnvironment();

    static bool isValidName(const std::string &name)
    {
        return !name.empty() &&
            name.find_first_not_of("abcdefghijklmnopqrstuvwxyz.") ==
            std::string::npos;
    }

private:
    typedef boost::multi_index_container<
        ConfigVarBase::ptr,
        boost::multi_index::indexed_by<
            boost::multi_index::ordered_unique<
                boost::multi_index::const_mem_fun<ConfigVarBase,
                    const std::string &, &ConfigVarBase::name> > > >
        ConfigVarSet;

    static ConfigVarSet &vars()
    {
        static ConfigVarSet vars;
        return vars;
    }
};

}

#endif
