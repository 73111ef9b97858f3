#ifndef __CATENA_EXCEPTION_H__
#define __CATENA_EXCEPTION_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "version.h"

#include <errno.h>

#include <stdexcept>
#include <string>
#include <vector>

#include <boost/exception/all.hpp>

namespace Catena {

/// Every exception thrown by catena derives from Exception, so it carries
/// boost::exception error_info (throw site, backtrace, errno, ...) and can
/// still be caught as a std::exception
struct Exception : virtual boost::exception, virtual std::exception {};

struct StreamException : virtual Exception {};
/// The Stream ended in the middle of something that needed more data
struct UnexpectedEofException : virtual StreamException {};
struct WriteBeyondEofException : virtual StreamException {};
/// A find() looked further ahead than it was allowed to
struct BufferOverflowException : virtual StreamException {};
/// The Stream was used before it was opened, or after it was closed
struct ClosedStreamException : virtual StreamException {};
/// A Stream (or one of the Streams it is built from) lacks a capability the
/// operation requires
struct UnsupportedOperationException : virtual StreamException {};

/// A system call failed; errinfo_nativeerror holds errno
struct NativeException : virtual Exception {};
struct FileNotFoundException : virtual NativeException {};
struct BadHandleException : virtual NativeException {};
struct AccessDeniedException : virtual NativeException {};
struct BrokenPipeException : virtual NativeException {};
struct IsDirectoryException : virtual NativeException {};
struct IsNotDirectoryException : virtual NativeException {};

typedef int error_t;
typedef boost::errinfo_errno errinfo_nativeerror;
typedef boost::error_info<struct tag_backtrace, std::vector<void *> >
    errinfo_backtrace;

/// Return addresses of the calling thread, innermost first
std::vector<void *> backtrace(int framesToSkip = 0);
std::string to_string(const std::vector<void *> &backtrace);
std::string to_string(const errinfo_backtrace &backtrace);

/// Trim the frames @c ex shares with the current stack, so an exception that
/// is caught and forwarded (across Fibers, for instance) does not repeat them
void removeTopFrames(boost::exception &ex, int framesToSkip = 0);
/// boost::rethrow_exception that appends the rethrowing stack to the
/// backtrace already recorded in the exception
void rethrow_exception(const boost::exception_ptr &exception);

error_t lastError();
void lastError(error_t error);

/// Throw the NativeException subclass that corresponds to @c error
void throwExceptionFromError(error_t error);

#define CATENA_EXCEPTION_THROW_SITE                                             \
    ::boost::throw_function(BOOST_CURRENT_FUNCTION)                             \
        << ::boost::throw_file(__FILE__)                                        \
        << ::boost::throw_line((int)__LINE__)                                   \
        << ::Catena::errinfo_backtrace(::Catena::backtrace())

#define CATENA_THROW_EXCEPTION(x)                                               \
    throw ::boost::enable_current_exception(::boost::enable_error_info(x))      \
        << CATENA_EXCEPTION_THROW_SITE

#define CATENA_THROW_EXCEPTION_FROM_ERROR_API(error, api)                       \
    try {                                                                       \
        ::Catena::throwExceptionFromError(error);                               \
    } catch (::boost::exception &ex) {                                          \
        ex << CATENA_EXCEPTION_THROW_SITE                                       \
            << ::boost::errinfo_api_function(api);                              \
        throw;                                                                  \
    }

#define CATENA_THROW_EXCEPTION_FROM_LAST_ERROR_API(api)                         \
    CATENA_THROW_EXCEPTION_FROM_ERROR_API(::Catena::lastError(), api)

}

#endif
