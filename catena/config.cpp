// Copyright (c) 2009 - Mozy, Inc.

#include "config.h"

#include <ctype.h>
#include <string.h>

extern char **environ;

namespace Catena {

static Logger::ptr g_log = Log::lookup("catena:config");

ConfigVarBase::ptr
Config::lookup(const std::string &name)
{
    ConfigVarSet::const_iterator it = vars().find(name);
    return it == vars().end() ? ConfigVarBase::ptr() : *it;
}

void
Config::loadFromCommandLine(int &argc, char *argv[])
{
    if (argc <= 1)
        return;
    int kept = 1, i = 1;
    for (; i < argc; ++i) {
        char *arg = argv[i];
        if (strcmp(arg, "--") == 0)
            break;
        ConfigVarBase::ptr var;
        std::string name;
        const char *value = NULL;
        bool separateValue = false;
        if (strncmp(arg, "--", 2u) == 0) {
            const char *equals = strchr(arg + 2, '=');
            name = equals ? std::string(arg + 2, equals - (arg + 2)) :
                std::string(arg + 2);
            var = lookup(name);
            if (equals) {
                value = equals + 1;
            } else if (i + 1 < argc) {
                value = argv[i + 1];
                separateValue = true;
            }
        }
        if (!var) {
            argv[kept++] = arg;
            continue;
        }
        if (!value || !var->fromString(value))
            CATENA_THROW_EXCEPTION(std::invalid_argument(name));
        CATENA_LOG_VERBOSE(g_log) << name << " = " << var->toString()
            << " (command line)";
        if (separateValue)
            ++i;
    }
    for (; i < argc; ++i)
        argv[kept++] = argv[i];
    argc = kept;
}

void
Config::loadFromEnvironment()
{
    if (!environ)
        return;
    for (char **entry = environ; *entry; ++entry) {
        const char *equals = strchr(*entry, '=');
        if (!equals || equals == *entry)
            continue;
        std::string name(*entry, equals - *entry);
        for (std::string::iterator it = name.begin(); it != name.end(); ++it)
            *it = *it == '_' ? '.' : (char)tolower((unsigned char)*it);
        if (!isValidName(name))
            continue;
        ConfigVarBase::ptr var = lookup(name);
        if (!var)
            continue;
        if (var->fromString(equals + 1))
            CATENA_LOG_VERBOSE(g_log) << name << " = " << var->toString()
                << " (environment)";
        else
            CATENA_LOG_WARNING(g_log) << "ignoring invalid value '"
                << equals + 1 << "' for " << name;
    }
}

}
