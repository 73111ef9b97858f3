// Copyright (c) 2009 - Mozy, Inc.

#include <stdlib.h>

#include <boost/bind.hpp>

#include "catena/config.h"
#include "catena/test/test.h"

using namespace Catena;
using namespace Catena::Test;

static ConfigVar<int>::ptr g_testVar = Config::lookup(
    "config.test", 0, "Config var used by unit test");

static void setArgs(std::string *args, char **argv, int argc)
{
    for (int i = 0; i < argc; ++i)
        argv[i] = const_cast<char *>(args[i].c_str());
}

CATENA_UNITTEST(Config, lookup)
{
    ConfigVarBase::ptr var = Config::lookup("config.test");
    CATENA_TEST_ASSERT(var == g_testVar);
    CATENA_TEST_ASSERT_EQUAL(var->description(),
        "Config var used by unit test");
    CATENA_TEST_ASSERT(!Config::lookup("config.nosuchvar"));
    // Everything the streams are tuned with is registered up front
    CATENA_TEST_ASSERT(Config::lookup("stream.readline.chunksize"));
    CATENA_TEST_ASSERT(Config::lookup("stream.buffered.defaultbuffersize"));
    CATENA_TEST_ASSERT(Config::lookup("transferstream.chunksize"));
}

CATENA_UNITTEST(Config, fromString)
{
    g_testVar->val(0);
    CATENA_TEST_ASSERT(g_testVar->fromString("42"));
    CATENA_TEST_ASSERT_EQUAL(g_testVar->val(), 42);
    CATENA_TEST_ASSERT_EQUAL(g_testVar->toString(), "42");
    CATENA_TEST_ASSERT(!g_testVar->fromString("forty-two"));
    CATENA_TEST_ASSERT_EQUAL(g_testVar->val(), 42);
    g_testVar->val(0);
}

CATENA_UNITTEST(Config, rejectZeroChunkSize)
{
    ConfigVarBase::ptr var = Config::lookup("stream.readline.chunksize");
    CATENA_TEST_ASSERT(var);
    std::string previous = var->toString();
    CATENA_TEST_ASSERT(!var->fromString("0"));
    CATENA_TEST_ASSERT_EQUAL(var->toString(), previous);
}

CATENA_UNITTEST(Config, loadFromCommandLineNull)
{
    int argc = 0;
    char **argv = NULL;
    Config::loadFromCommandLine(argc, argv);
    CATENA_TEST_ASSERT_EQUAL(argc, 0);
    CATENA_TEST_ASSERT(argv == NULL);
}

CATENA_UNITTEST(Config, loadFromCommandLineEquals)
{
    int argc = 3;
    std::string args[] = { "catcat", "--config.test=7", "part1" };
    char *argv[3];
    setArgs(args, argv, argc);
    g_testVar->val(0);
    Config::loadFromCommandLine(argc, argv);
    CATENA_TEST_ASSERT_EQUAL(argc, 2);
    CATENA_TEST_ASSERT_EQUAL((const char *)argv[0], "catcat");
    CATENA_TEST_ASSERT_EQUAL((const char *)argv[1], "part1");
    CATENA_TEST_ASSERT_EQUAL(g_testVar->val(), 7);
    g_testVar->val(0);
}

CATENA_UNITTEST(Config, loadFromCommandLineSeparateValue)
{
    int argc = 5;
    std::string args[] = { "catcat", "--unknown", "--config.test", "9",
        "part1" };
    char *argv[5];
    setArgs(args, argv, argc);
    g_testVar->val(0);
    Config::loadFromCommandLine(argc, argv);
    CATENA_TEST_ASSERT_EQUAL(argc, 3);
    CATENA_TEST_ASSERT_EQUAL((const char *)argv[1], "--unknown");
    CATENA_TEST_ASSERT_EQUAL((const char *)argv[2], "part1");
    CATENA_TEST_ASSERT_EQUAL(g_testVar->val(), 9);
    g_testVar->val(0);
}

CATENA_UNITTEST(Config, loadFromCommandLineStopsAtDoubleDash)
{
    int argc = 3;
    std::string args[] = { "catcat", "--", "--config.test=7" };
    char *argv[3];
    setArgs(args, argv, argc);
    g_testVar->val(0);
    Config::loadFromCommandLine(argc, argv);
    CATENA_TEST_ASSERT_EQUAL(argc, 3);
    CATENA_TEST_ASSERT_EQUAL(g_testVar->val(), 0);
}

CATENA_UNITTEST(Config, loadFromCommandLineBadValue)
{
    int argc = 2;
    std::string args[] = { "catcat", "--config.test=seven" };
    char *argv[2];
    setArgs(args, argv, argc);
    CATENA_TEST_ASSERT_EXCEPTION(Config::loadFromCommandLine(argc, argv),
        std::invalid_argument);

    argc = 2;
    args[1] = "--config.test";
    setArgs(args, argv, argc);
    CATENA_TEST_ASSERT_EXCEPTION(Config::loadFromCommandLine(argc, argv),
        std::invalid_argument);
}

CATENA_UNITTEST(Config, loadFromEnvironment)
{
    g_testVar->val(0);
    setenv("CONFIG_TEST", "11", 1);
    Config::loadFromEnvironment();
    unsetenv("CONFIG_TEST");
    CATENA_TEST_ASSERT_EQUAL(g_testVar->val(), 11);

    // Invalid values are ignored
    setenv("CONFIG_TEST", "eleven", 1);
    Config::loadFromEnvironment();
    unsetenv("CONFIG_TEST");
    CATENA_TEST_ASSERT_EQUAL(g_testVar->val(), 11);
    g_testVar->val(0);
}

static bool rejectNegative(int value)
{
    return value >= 0;
}

static void recordChange(int value, int &changes)
{
    ++changes;
}

CATENA_UNITTEST(Config, signals)
{
    g_testVar->val(0);
    int changes = 0;
    boost::signals2::connection before =
        g_testVar->beforeChange.connect(&rejectNegative);
    boost::signals2::connection after =
        g_testVar->onValueChange.connect(boost::bind(&recordChange, _1,
        boost::ref(changes)));
    CATENA_TEST_ASSERT(!g_testVar->val(-1));
    CATENA_TEST_ASSERT_EQUAL(g_testVar->val(), 0);
    CATENA_TEST_ASSERT(g_testVar->val(3));
    CATENA_TEST_ASSERT_EQUAL(changes, 1);
    // Setting the same value is not a change
    CATENA_TEST_ASSERT(g_testVar->val(3));
    CATENA_TEST_ASSERT_EQUAL(changes, 1);
    before.disconnect();
    after.disconnect();
    g_testVar->val(0);
}
