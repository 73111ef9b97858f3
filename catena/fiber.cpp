// Copyright (c) 2009 - Mozy, Inc.

#include "fiber.h"

#include <sys/mman.h>
#include <unistd.h>

#include <ostream>

#include <boost/thread/tss.hpp>

#include "assert.h"
#include "config.h"

namespace Catena {

static ConfigVar<size_t>::ptr g_defaultStackSize = Config::lookup<size_t>(
    "fiber.defaultstacksize", 1024 * 1024u,
    "Default stack size for new fibers.  Only the pages a fiber touches are "
    "backed by memory.");

ThreadLocalStorage<Fiber *> Fiber::t_fiber;
// Owns the implicit Fiber of each thread, releasing it when the thread exits
static boost::thread_specific_ptr<Fiber::ptr> t_threadFiber;

Fiber::Fiber()
    : m_stack(NULL),
      m_stacksize(0),
      m_state(EXEC),
      m_exitState(EXEC),
      m_caller(NULL)
{
    CATENA_ASSERT(!t_fiber.get());
    t_fiber = this;
}

Fiber::Fiber(boost::function<void ()> dg, size_t stacksize)
    : m_dg(dg),
      m_stack(NULL),
      m_stacksize(stacksize ? stacksize : g_defaultStackSize->val()),
      m_state(INIT),
      m_exitState(INIT),
      m_caller(NULL)
{
    size_t pageSize = (size_t)sysconf(_SC_PAGESIZE);
    m_stacksize = (m_stacksize + pageSize - 1) / pageSize * pageSize;
    m_stack = mmap(NULL, m_stacksize, PROT_READ | PROT_WRITE,
        MAP_PRIVATE | MAP_ANON, -1, 0);
    if (m_stack == MAP_FAILED) {
        m_stack = NULL;
        CATENA_THROW_EXCEPTION_FROM_LAST_ERROR_API("mmap");
    }
    try {
        initStack();
    } catch (...) {
        munmap(m_stack, m_stacksize);
        throw;
    }
}

Fiber::~Fiber()
{
    if (m_stack) {
        CATENA_ASSERT_NOTHROW(m_state == INIT || m_state == TERM ||
            m_state == EXCEPT);
        munmap(m_stack, m_stacksize);
    } else if (t_fiber.get() == this) {
        t_fiber = NULL;
    }
}

void
Fiber::reset(boost::function<void ()> dg)
{
    CATENA_ASSERT(m_stack);
    CATENA_ASSERT(m_state == INIT || m_state == TERM || m_state == EXCEPT);
    m_dg = dg;
    m_exception = boost::exception_ptr();
    initStack();
    m_state = INIT;
}

Fiber::ptr
Fiber::getThis()
{
    Fiber *current = t_fiber.get();
    if (current)
        return current->shared_from_this();
    Fiber::ptr threadFiber(new Fiber());
    t_threadFiber.reset(new Fiber::ptr(threadFiber));
    return threadFiber;
}

void
Fiber::call()
{
    CATENA_ASSERT(m_stack);
    CATENA_ASSERT(m_state == INIT || m_state == HOLD);
    ptr self = shared_from_this();
    ptr caller = getThis();
    CATENA_ASSERT(caller != self);
    m_caller = caller.get();
    m_state = EXEC;
    t_fiber = this;
    switchFrom(*caller);

    t_fiber = caller.get();
    m_caller = NULL;
    State exitState = m_exitState;
    boost::exception_ptr exception;
    if (exitState == EXCEPT) {
        exception = m_exception;
        m_exception = boost::exception_ptr();
    }
    // Once we leave EXEC another thread is free to call() us again
    m_state = exitState;
    if (exception)
        Catena::rethrow_exception(exception);
}

void
Fiber::yield()
{
    Fiber *current = t_fiber.get();
    CATENA_ASSERT(current);
    CATENA_ASSERT(current->m_caller);
    current->m_exitState = HOLD;
    current->m_caller->switchFrom(*current);
}

void
Fiber::switchFrom(Fiber &from)
{
    if (swapcontext(&from.m_ctx, &m_ctx))
        CATENA_THROW_EXCEPTION_FROM_LAST_ERROR_API("swapcontext");
}

void
Fiber::entryPoint()
{
    // Nothing with a destructor may live in this frame; it is abandoned
    // rather than unwound
    Fiber *current = t_fiber.get();
    CATENA_ASSERT(current->m_dg);
    State exitState = TERM;
    try {
        current->m_dg();
    } catch (boost::exception &ex) {
        removeTopFrames(ex);
        current->m_exception = boost::current_exception();
        exitState = EXCEPT;
    } catch (...) {
        current->m_exception = boost::current_exception();
        exitState = EXCEPT;
    }
    current->m_exitState = exitState;
    setcontext(&current->m_caller->m_ctx);
    CATENA_NOTREACHED();
}

void
Fiber::initStack()
{
    if (getcontext(&m_ctx))
        CATENA_THROW_EXCEPTION_FROM_LAST_ERROR_API("getcontext");
    m_ctx.uc_link = NULL;
    m_ctx.uc_stack.ss_sp = m_stack;
    m_ctx.uc_stack.ss_size = m_stacksize;
    makecontext(&m_ctx, &Fiber::entryPoint, 0);
}

std::ostream &
operator<<(std::ostream &os, Fiber::State state)
{
    static const char *names[] = { "INIT", "HOLD", "EXEC", "EXCEPT", "TERM" };
    if (state >= Fiber::INIT && state <= Fiber::TERM)
        return os << names[state];
    return os << (int)state;
}

}
