// Copyright (c) 2010 - Mozy, Inc.

#include "assert.h"

#include <stdlib.h>

#include <exception>
#include <fstream>
#include <string>

namespace Catena {

bool Assertion::throwOnAssertion;

bool
isDebuggerAttached()
{
#ifdef LINUX
    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line)) {
        if (line.compare(0, 10, "TracerPid:") == 0)
            return atoi(line.c_str() + 10) != 0;
    }
#endif
    return false;
}

void
assertionFailed(const char *expr, const char *function, const char *file,
    int line, bool mayThrow)
{
    CATENA_LOG_FATAL(Log::root()) << "ASSERTION: " << expr << " in "
        << function << " (" << file << ":" << line << ")\nbacktrace:\n"
        << to_string(backtrace(1));
    if (mayThrow && Assertion::throwOnAssertion)
        throw boost::enable_current_exception(Assertion(expr))
            << boost::throw_function(function)
            << boost::throw_file(file)
            << boost::throw_line(line)
            << errinfo_backtrace(backtrace(1));
#ifdef X86
    if (isDebuggerAttached())
        __asm__("int $3\n" : : );
#endif
    std::terminate();
}

}
