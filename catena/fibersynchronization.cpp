// Copyright (c) 2009 - Mozy, Inc.

#include "fibersynchronization.h"

#include "assert.h"
#include "fiber.h"
#include "scheduler.h"

namespace Catena {
namespace detail {

FiberWaitQueue::~FiberWaitQueue()
{
    CATENA_ASSERT_NOTHROW(m_waiters.empty());
}

void
FiberWaitQueue::push()
{
    Scheduler *scheduler = Scheduler::getThis();
    // Only a Fiber with a Scheduler to come back to can block
    CATENA_ASSERT(scheduler);
    m_waiters.push_back(std::make_pair(scheduler, Fiber::getThis()));
}

Fiber::ptr
FiberWaitQueue::wakeOne()
{
    CATENA_ASSERT(!m_waiters.empty());
    std::pair<Scheduler *, Fiber::ptr> next = m_waiters.front();
    m_waiters.pop_front();
    next.first->schedule(next.second);
    return next.second;
}

FiberLock::FiberLock(bool recursive)
    : m_recursive(recursive),
      m_depth(0)
{}

FiberLock::~FiberLock()
{
    CATENA_ASSERT_NOTHROW(!m_owner);
}

void
FiberLock::lock()
{
    Fiber::ptr self = Fiber::getThis();
    {
        boost::mutex::scoped_lock guard(m_mutex);
        if (!m_owner) {
            m_owner = self;
            m_depth = 1;
            return;
        }
        if (m_owner == self) {
            CATENA_ASSERT(m_recursive);
            ++m_depth;
            return;
        }
        m_waiters.push();
    }
    // unlock() makes us the owner before it reschedules us
    Scheduler::yieldTo();
    CATENA_ASSERT(ownedByThisFiber());
}

void
FiberLock::unlock()
{
    boost::mutex::scoped_lock guard(m_mutex);
    CATENA_ASSERT(m_owner == Fiber::getThis());
    CATENA_ASSERT(m_depth > 0);
    if (--m_depth > 0)
        return;
    m_owner.reset();
    if (!m_waiters.empty()) {
        // Hand over directly, so nobody can barge in ahead of the waiter
        m_owner = m_waiters.wakeOne();
        m_depth = 1;
    }
}

bool
FiberLock::ownedByThisFiber()
{
    boost::mutex::scoped_lock guard(m_mutex);
    return m_owner && m_owner == Fiber::getThis();
}

}

FiberSemaphore::FiberSemaphore(size_t initialConcurrency)
    : m_concurrency(initialConcurrency)
{}

void
FiberSemaphore::wait()
{
    {
        boost::mutex::scoped_lock guard(m_mutex);
        if (m_concurrency > 0) {
            --m_concurrency;
            return;
        }
        m_waiters.push();
    }
    Scheduler::yieldTo();
}

void
FiberSemaphore::notify()
{
    boost::mutex::scoped_lock guard(m_mutex);
    if (m_waiters.empty())
        ++m_concurrency;
    else
        m_waiters.wakeOne();
}

}
