#ifndef __CATENA_FIBER_H__
#define __CATENA_FIBER_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "version.h"

#include <ucontext.h>

#include <iosfwd>

#include <boost/enable_shared_from_this.hpp>
#include <boost/exception_ptr.hpp>
#include <boost/function.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include "thread_local_storage.h"

namespace Catena {

/// Cooperative thread with a stack of its own
/// @details
/// A Fiber runs when some other Fiber call()s it, and gives control back to
/// that caller when it yield()s, returns or throws.  Whoever calls a Fiber
/// next (possibly on another thread) resumes it where it yielded.
///
/// Every thread implicitly has a Fiber of its own, representing the stack
/// the thread started on; getThis() creates it on first use.
class Fiber : public boost::enable_shared_from_this<Fiber>, boost::noncopyable
{
public:
    typedef boost::shared_ptr<Fiber> ptr;

    enum State
    {
        /// Not started since it was constructed or reset()
        INIT,
        /// Yielded; waiting to be called again
        HOLD,
        /// Running, or in the middle of switching away
        EXEC,
        /// Finished by throwing; the exception went to the caller
        EXCEPT,
        /// Finished by returning
        TERM
    };

private:
    // The implicit Fiber of a thread
    Fiber();

public:
    /// @param dg What to run
    /// @param stacksize Stack size; 0 means fiber.defaultstacksize
    /// @post state() == INIT
    Fiber(boost::function<void ()> dg, size_t stacksize = 0);
    ~Fiber();

    /// Start over with a new function, reusing the stack
    /// @pre state() == INIT || state() == TERM || state() == EXCEPT
    /// @post state() == INIT
    void reset(boost::function<void ()> dg);

    /// @return The Fiber running on this thread
    static ptr getThis();

    /// @brief Run this Fiber until it yields or finishes
    /// @details
    /// If the Fiber finishes by throwing, call() rethrows the exception.
    /// @pre state() == INIT || state() == HOLD
    void call();

    /// @brief Suspend the current Fiber, returning from the call() that ran it
    /// @pre The current Fiber was started by call()
    static void yield();

    State state() const { return m_state; }

private:
    static void entryPoint();
    void switchFrom(Fiber &from);
    void initStack();

private:
    boost::function<void ()> m_dg;
    void *m_stack;
    size_t m_stacksize;
    ucontext_t m_ctx;
    State m_state, m_exitState;
    // The Fiber blocked in call() on us; only set while we are running
    Fiber *m_caller;
    boost::exception_ptr m_exception;

    static ThreadLocalStorage<Fiber *> t_fiber;
};

std::ostream &operator<<(std::ostream &os, Fiber::State state);

}

#endif
