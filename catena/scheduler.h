#ifndef __CATENA_SCHEDULER_H__
#define __CATENA_SCHEDULER_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <list>
#include <vector>

#include <boost/function.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>

#include "thread_local_storage.h"

namespace Catena {

class Fiber;

/// Runs Fibers on a set of threads
/// @details
/// A Scheduler keeps a FIFO queue of Fibers and functors, and every thread it
/// controls takes work off that queue.  It may spawn threads of its own,
/// "hijack" the thread that constructed it (useCaller), or both.
///
/// A hijacked thread only does work for the Scheduler while the thread's own
/// code is waiting in yieldTo(), dispatch() or stop(); a Fiber blocked on a
/// FiberMutex, for example, lets the rest of the queue run until it is
/// rescheduled.
class Scheduler : boost::noncopyable
{
public:
    /// @param threads Total number of threads, including the hijacked one
    /// @param useCaller Hijack the constructing thread
    /// @pre !useCaller || Scheduler::getThis() == NULL
    Scheduler(size_t threads = 1, bool useCaller = true);
    /// Derived classes must stop() in their destructor
    virtual ~Scheduler();

    /// @return The Scheduler controlling the current thread, if any
    static Scheduler *getThis();

    /// Spawn the threads; derived classes call this once constructed
    void start();
    /// @brief Run everything that is scheduled, then release the threads
    /// @details
    /// Must be called from outside the Scheduler: from the hijacked thread's
    /// own code, or from an unrelated thread if nothing was hijacked.
    void stop();

    void schedule(boost::shared_ptr<Fiber> fiber);
    /// Run @c dg on a Fiber of the Scheduler's choosing
    void schedule(boost::function<void ()> dg);

    /// @brief Suspend the current Fiber until someone schedules it again
    /// @pre Scheduler::getThis() != NULL
    static void yieldTo();
    /// Reschedule the current Fiber, then yieldTo()
    static void yield();

    /// @brief Run the queue on the hijacked thread until it is empty
    /// @pre The Scheduler hijacked this thread and has no other threads
    void dispatch();

protected:
    /// Block the calling thread until tickle() is called
    virtual void idle() = 0;
    /// Wake one thread blocked in idle()
    virtual void tickle() = 0;

    /// Asked to stop, and nothing is queued or running
    bool stopping();

private:
    struct Task {
        boost::shared_ptr<Fiber> fiber;
        boost::function<void ()> dg;
    };

    void run();
    void enqueue(const Task &task);

private:
    static ThreadLocalStorage<Scheduler *> t_scheduler;

    boost::mutex m_mutex;
    std::list<Task> m_queue;
    size_t m_threadCount, m_running;
    bool m_stopping, m_autoStop;
    std::vector<boost::shared_ptr<boost::thread> > m_threads;
    // Only for a hijacking Scheduler: the Fiber running run() on the hijacked
    // thread, and the thread's own Fiber while it waits on that
    boost::thread::id m_rootThread;
    boost::shared_ptr<Fiber> m_rootFiber, m_waitingFiber;
};

}

#endif
