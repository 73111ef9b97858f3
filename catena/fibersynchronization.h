#ifndef __CATENA_FIBERSYNCHRONIZATION_H__
#define __CATENA_FIBERSYNCHRONIZATION_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <list>
#include <utility>

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/mutex.hpp>

namespace Catena {

class Fiber;
class Scheduler;

/// Locks on construction and unlocks on destruction, unless unlock() was
/// called first
template <class Mutex>
class ScopedLockImpl : boost::noncopyable
{
public:
    ScopedLockImpl(Mutex &mutex)
        : m_mutex(mutex),
          m_locked(false)
    { lock(); }
    ~ScopedLockImpl() { unlock(); }

    void lock()
    {
        if (!m_locked) {
            m_mutex.lock();
            m_locked = true;
        }
    }

    void unlock()
    {
        if (m_locked) {
            m_locked = false;
            m_mutex.unlock();
        }
    }

private:
    Mutex &m_mutex;
    bool m_locked;
};

namespace detail {

/// Fibers parked on a synchronization object, in arrival order, each with
/// the Scheduler that has to run it again
class FiberWaitQueue
{
public:
    ~FiberWaitQueue();

    bool empty() const { return m_waiters.empty(); }
    /// Record the current Fiber; the caller then releases its own lock and
    /// calls Scheduler::yieldTo()
    void push();
    /// Reschedule the longest waiting Fiber
    /// @return The Fiber that was woken
    /// @pre !empty()
    boost::shared_ptr<Fiber> wakeOne();

private:
    std::list<std::pair<Scheduler *, boost::shared_ptr<Fiber> > > m_waiters;
};

/// Fiber-owned lock; a contended lock() yields the Fiber to its Scheduler
/// and ownership passes to waiters in FIFO order
class FiberLock : boost::noncopyable
{
protected:
    FiberLock(bool recursive);
    ~FiberLock();

    void lock();
    void unlock();
    bool ownedByThisFiber();

private:
    const bool m_recursive;
    boost::mutex m_mutex;
    boost::shared_ptr<Fiber> m_owner;
    unsigned int m_depth;
    FiberWaitQueue m_waiters;
};

}

/// Mutex for Fibers
/// @details
/// Locking an uncontended FiberMutex needs no Scheduler; waiting for one
/// does.  After lock() returns the Fiber may be running on another thread
/// of the same Scheduler.
class FiberMutex : public detail::FiberLock
{
public:
    typedef ScopedLockImpl<FiberMutex> ScopedLock;

    FiberMutex() : FiberLock(false) {}

    /// @pre The current Fiber does not own the mutex
    void lock() { FiberLock::lock(); }
    /// @pre The current Fiber owns the mutex
    void unlock() { FiberLock::unlock(); }
};

/// FiberMutex that its owner may lock again; it is released when every
/// lock() has been matched by an unlock()
class RecursiveFiberMutex : public detail::FiberLock
{
public:
    typedef ScopedLockImpl<RecursiveFiberMutex> ScopedLock;

    RecursiveFiberMutex() : FiberLock(true) {}

    void lock() { FiberLock::lock(); }
    void unlock() { FiberLock::unlock(); }
    bool ownedByThisFiber() { return FiberLock::ownedByThisFiber(); }
};

/// Counting semaphore for Fibers; wait() yields to the Scheduler while the
/// count is zero, and waiters are released in FIFO order
class FiberSemaphore : boost::noncopyable
{
public:
    FiberSemaphore(size_t initialConcurrency = 0);

    /// @pre Scheduler::getThis() != NULL, unless the count is positive
    void wait();
    void notify();

private:
    boost::mutex m_mutex;
    size_t m_concurrency;
    detail::FiberWaitQueue m_waiters;
};

}

#endif
