#ifndef __CATENA_ASSERT_H__
#define __CATENA_ASSERT_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <exception>

#include <boost/config.hpp>

#include "exception.h"
#include "log.h"

namespace Catena {

/// Thrown by a failed CATENA_ASSERT when Assertion::throwOnAssertion is set
struct Assertion : virtual Exception
{
    Assertion(const std::string &expr) : m_expr(expr) {}
    ~Assertion() throw() {}

    const char *what() const throw() { return m_expr.c_str(); }

    /// The test harness sets this so a failed assertion fails the current
    /// test instead of the whole process
    static bool throwOnAssertion;

private:
    std::string m_expr;
};

bool isDebuggerAttached();
/// Log the failure, then throw, trap into the debugger or terminate
/// @param mayThrow false where an exception cannot leave (destructors);
/// throwOnAssertion is ignored then
BOOST_NORETURN void assertionFailed(const char *expr,
    const char *function, const char *file, int line, bool mayThrow = true);

}

#endif

// No include guard below; this part may be included again after NDEBUG
// changes
#undef CATENA_ASSERT
#undef CATENA_ASSERT_NOTHROW
#undef CATENA_VERIFY
#undef CATENA_NOTREACHED

#ifdef NDEBUG
#define CATENA_ASSERT(x) ((void)0)
#define CATENA_ASSERT_NOTHROW(x) ((void)0)
#define CATENA_VERIFY(x) ((void)(x))
#define CATENA_NOTREACHED() ::std::terminate()
#else
#define CATENA_ASSERT(x)                                                        \
    ((x) ? (void)0 : ::Catena::assertionFailed(# x, BOOST_CURRENT_FUNCTION,     \
        __FILE__, __LINE__))
#define CATENA_ASSERT_NOTHROW(x)                                                \
    ((x) ? (void)0 : ::Catena::assertionFailed(# x, BOOST_CURRENT_FUNCTION,     \
        __FILE__, __LINE__, false))
#define CATENA_VERIFY(x) CATENA_ASSERT(x)
#define CATENA_NOTREACHED()                                                     \
    ::Catena::assertionFailed("not reached", BOOST_CURRENT_FUNCTION, __FILE__,  \
        __LINE__)
#endif
