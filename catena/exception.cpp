// Copyright (c) 2009 - Mozy, Inc.

#include "exception.h"

#include <execinfo.h>
#include <stdlib.h>

#include <algorithm>
#include <sstream>

#include <boost/shared_ptr.hpp>

namespace Catena {

static const int g_maxFrames = 64;

std::vector<void *>
backtrace(int framesToSkip)
{
    void *frames[g_maxFrames];
    int count = ::backtrace(frames, g_maxFrames);
    // Never report ourselves
    int first = std::min(count, framesToSkip + 1);
    return std::vector<void *>(frames + first, frames + count);
}

std::string
to_string(const std::vector<void *> &backtrace)
{
    if (backtrace.empty())
        return std::string();
    boost::shared_ptr<char *> symbols(backtrace_symbols(&backtrace[0],
        (int)backtrace.size()), &free);
    std::ostringstream os;
    for (size_t i = 0; i < backtrace.size(); ++i) {
        if (i != 0)
            os << '\n';
        if (symbols)
            os << symbols.get()[i];
        else
            os << backtrace[i];
    }
    return os.str();
}

std::string
to_string(const errinfo_backtrace &backtrace)
{
    return to_string(backtrace.value());
}

void
removeTopFrames(boost::exception &ex, int framesToSkip)
{
    const std::vector<void *> *recorded =
        boost::get_error_info<errinfo_backtrace>(ex);
    if (!recorded || recorded->empty())
        return;
    std::vector<void *> here = backtrace(framesToSkip + 1);
    // Count the outermost frames both stacks have in common
    size_t shared = 0;
    std::vector<void *>::const_reverse_iterator lhs = recorded->rbegin();
    std::vector<void *>::const_reverse_iterator rhs = here.rbegin();
    while (lhs != recorded->rend() && rhs != here.rend() && *lhs == *rhs) {
        ++shared;
        ++lhs;
        ++rhs;
    }
    if (shared == 0)
        return;
    std::vector<void *> trimmed(recorded->begin(),
        recorded->end() - shared);
    ex << errinfo_backtrace(trimmed);
}

void
rethrow_exception(const boost::exception_ptr &exception)
{
    // Captured before the try block so the handler's frames stay out of it
    std::vector<void *> here = backtrace(1);
    try {
        boost::rethrow_exception(exception);
    } catch (boost::exception &ex) {
        const std::vector<void *> *recorded =
            boost::get_error_info<errinfo_backtrace>(ex);
        if (recorded)
            here.insert(here.begin(), recorded->begin(), recorded->end());
        ex << errinfo_backtrace(here);
        throw;
    }
}

error_t
lastError()
{
    return errno;
}

void
lastError(error_t error)
{
    errno = error;
}

template <class T>
static void
throwNative(error_t error)
{
    throw boost::enable_current_exception(T()) << errinfo_nativeerror(error);
}

void
throwExceptionFromError(error_t error)
{
    switch (error) {
        case EBADF:
            throwNative<BadHandleException>(error);
        case ENOENT:
            throwNative<FileNotFoundException>(error);
        case EACCES:
        case EPERM:
            throwNative<AccessDeniedException>(error);
        case EPIPE:
            throwNative<BrokenPipeException>(error);
        case EISDIR:
            throwNative<IsDirectoryException>(error);
        case ENOTDIR:
            throwNative<IsNotDirectoryException>(error);
        default:
            throwNative<NativeException>(error);
    }
}

}
