// Copyright (c) 2009 - Mozy, Inc.

#include "config.h"

#include <ctype.h>
#include <string.h>

#include <stdexcept>

#include "exception.h"
#include "log.h"

extern char **environ;

namespace Sluice {

static Logger::ptr g_log = Log::lookup("sluice:config");

static const char *g_nameCharacters = "abcdefghijklmnopqrstuvwxyz.";

Config::ConfigVarSet &
Config::vars()
{
    static ConfigVarSet vars;
    return vars;
}

void
Config::checkName(const std::string &name)
{
    if (name.empty() ||
        name.find_first_not_of(g_nameCharacters) != std::string::npos)
        SLUICE_THROW_EXCEPTION(std::invalid_argument(name));
}

ConfigVarBase::ptr
Config::lookup(const std::string &name)
{
    ConfigVarSet::const_iterator it = vars().find(name);
    return it == vars().end() ? ConfigVarBase::ptr() : *it;
}

void
Config::loadFromCommandLine(int &argc, char *argv[])
{
    int kept = 1;
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--")
            break;
        if (arg.compare(0, 2, "--") != 0) {
            argv[kept++] = argv[i];
            continue;
        }
        size_t equals = arg.find('=');
        std::string name = arg.substr(2, equals == std::string::npos ?
            std::string::npos : equals - 2);
        ConfigVarBase::ptr var = lookup(name);
        if (!var) {
            argv[kept++] = argv[i];
            continue;
        }
        std::string value;
        if (equals != std::string::npos) {
            value = arg.substr(equals + 1);
        } else {
            if (i + 1 == argc)
                SLUICE_THROW_EXCEPTION(std::invalid_argument(name));
            value = argv[++i];
        }
        if (!var->fromString(value))
            SLUICE_THROW_EXCEPTION(std::invalid_argument(name));
        SLUICE_LOG_VERBOSE(g_log) << name << " = " << var->toString()
            << " (command line)";
    }
    // Everything from a bare -- on is passed through untouched
    for (; i < argc; ++i)
        argv[kept++] = argv[i];
    argc = kept;
}

void
Config::loadFromEnvironment()
{
    for (char **env = environ; env && *env; ++env) {
        const char *equals = strchr(*env, '=');
        if (!equals || equals == *env)
            continue;
        std::string name;
        for (const char *c = *env; c != equals; ++c)
            name += (*c == '_') ? '.' : (char)tolower(*c);
        if (name.find_first_not_of(g_nameCharacters) != std::string::npos)
            continue;
        ConfigVarBase::ptr var = lookup(name);
        if (!var)
            continue;
        if (var->fromString(equals + 1)) {
            SLUICE_LOG_VERBOSE(g_log) << name << " = " << var->toString()
                << " (environment)";
        } else {
            SLUICE_LOG_WARNING(g_log) << "rejected value \"" << equals + 1
                << "\" for " << name << " from the environment";
        }
    }
}

}
