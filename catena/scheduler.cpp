// Copyright (c) 2009 - Mozy, Inc.

#include "scheduler.h"

#include <boost/bind.hpp>

#include "assert.h"
#include "fiber.h"

namespace Catena {

static Logger::ptr g_log = Log::lookup("catena:scheduler");

ThreadLocalStorage<Scheduler *> Scheduler::t_scheduler;

Scheduler::Scheduler(size_t threads, bool useCaller)
    : m_threadCount(threads),
      m_running(0),
      m_stopping(true),
      m_autoStop(false)
{
    if (useCaller) {
        CATENA_ASSERT(threads >= 1);
        CATENA_ASSERT(!getThis());
        --m_threadCount;
        t_scheduler = this;
        m_rootThread = boost::this_thread::get_id();
        m_rootFiber.reset(new Fiber(boost::bind(&Scheduler::run, this)));
    }
}

Scheduler::~Scheduler()
{
    CATENA_ASSERT_NOTHROW(m_stopping);
    if (getThis() == this)
        t_scheduler = NULL;
}

Scheduler *
Scheduler::getThis()
{
    return t_scheduler.get();
}

void
Scheduler::start()
{
    boost::mutex::scoped_lock lock(m_mutex);
    CATENA_ASSERT(m_stopping);
    CATENA_ASSERT(m_threads.empty());
    CATENA_LOG_VERBOSE(g_log) << this << " starting " << m_threadCount
        << " threads";
    m_stopping = false;
    for (size_t i = 0; i < m_threadCount; ++i)
        m_threads.push_back(boost::shared_ptr<boost::thread>(
            new boost::thread(boost::bind(&Scheduler::run, this))));
}

void
Scheduler::stop()
{
    {
        boost::mutex::scoped_lock lock(m_mutex);
        m_stopping = true;
    }
    for (size_t i = 0; i < m_threadCount; ++i)
        tickle();
    if (m_rootFiber) {
        CATENA_ASSERT(getThis() == this);
        CATENA_ASSERT(m_rootFiber->state() != Fiber::EXEC);
        // Keep lending this thread to the queue until it drains, and let
        // run() return if it handed the thread back half way
        while (!stopping() || m_rootFiber->state() == Fiber::HOLD)
            yieldTo();
    } else {
        CATENA_ASSERT(getThis() != this);
    }

    std::vector<boost::shared_ptr<boost::thread> > threads;
    {
        boost::mutex::scoped_lock lock(m_mutex);
        threads.swap(m_threads);
    }
    CATENA_LOG_DEBUG(g_log) << this << " joining " << threads.size()
        << " threads";
    for (size_t i = 0; i < threads.size(); ++i)
        threads[i]->join();
    CATENA_LOG_VERBOSE(g_log) << this << " stopped";
}

bool
Scheduler::stopping()
{
    boost::mutex::scoped_lock lock(m_mutex);
    return m_stopping && m_queue.empty() && m_running == 0;
}

void
Scheduler::schedule(boost::shared_ptr<Fiber> fiber)
{
    CATENA_ASSERT(fiber);
    Task task;
    task.fiber = fiber;
    enqueue(task);
}

void
Scheduler::schedule(boost::function<void ()> dg)
{
    CATENA_ASSERT(dg);
    Task task;
    task.dg = dg;
    enqueue(task);
}

void
Scheduler::enqueue(const Task &task)
{
    bool wasEmpty;
    {
        boost::mutex::scoped_lock lock(m_mutex);
        wasEmpty = m_queue.empty();
        m_queue.push_back(task);
    }
    CATENA_LOG_TRACE(g_log) << this << " scheduled "
        << (task.fiber ? "fiber " : "functor ") << task.fiber;
    if (wasEmpty)
        tickle();
}

void
Scheduler::yieldTo()
{
    Scheduler *self = getThis();
    CATENA_ASSERT(self);
    Fiber::ptr root = self->m_rootFiber;
    if (!root || root->state() == Fiber::EXEC ||
        boost::this_thread::get_id() != self->m_rootThread) {
        Fiber::yield();
        return;
    }
    // The hijacked thread's own code is waiting; run the queue on this
    // thread until someone schedules it again
    {
        boost::mutex::scoped_lock lock(self->m_mutex);
        self->m_waitingFiber = Fiber::getThis();
    }
    if (root->state() == Fiber::TERM || root->state() == Fiber::EXCEPT)
        root->reset(boost::bind(&Scheduler::run, self));
    try {
        root->call();
    } catch (...) {
        boost::mutex::scoped_lock lock(self->m_mutex);
        self->m_waitingFiber.reset();
        throw;
    }
    boost::mutex::scoped_lock lock(self->m_mutex);
    self->m_waitingFiber.reset();
}

void
Scheduler::yield()
{
    Scheduler *self = getThis();
    CATENA_ASSERT(self);
    self->schedule(Fiber::getThis());
    yieldTo();
}

void
Scheduler::dispatch()
{
    CATENA_ASSERT(m_rootFiber);
    CATENA_ASSERT(m_threadCount == 0);
    CATENA_ASSERT(boost::this_thread::get_id() == m_rootThread);
    CATENA_LOG_DEBUG(g_log) << this << " dispatching";
    m_autoStop = true;
    try {
        yieldTo();
    } catch (...) {
        m_autoStop = false;
        throw;
    }
    m_autoStop = false;
}

void
Scheduler::run()
{
    t_scheduler = this;
    const bool rootThread = boost::this_thread::get_id() == m_rootThread;
    Fiber::ptr dgFiber;
    while (true) {
        Task task;
        bool found = false, busy = false, done = false, more = false;
        {
            boost::mutex::scoped_lock lock(m_mutex);
            std::list<Task>::iterator it = m_queue.begin();
            for (; it != m_queue.end(); ++it) {
                if (!it->fiber)
                    break;
                if (rootThread && it->fiber == m_waitingFiber)
                    break;
                // Still switching away on another thread (or it is some
                // thread's own Fiber); it cannot be called from here yet
                if (it->fiber->state() == Fiber::EXEC) {
                    busy = true;
                    continue;
                }
                break;
            }
            if (it != m_queue.end()) {
                task = *it;
                m_queue.erase(it);
                ++m_running;
                found = true;
                more = !m_queue.empty();
            } else if (!busy) {
                done = (m_stopping && m_running == 0) ||
                    (rootThread && m_autoStop && m_queue.empty());
            }
        }

        if (!found) {
            if (done) {
                CATENA_LOG_DEBUG(g_log) << this << " out of work";
                // Pass the news on to the next idle thread
                if (m_stopping)
                    tickle();
                return;
            }
            if (!busy) {
                CATENA_LOG_TRACE(g_log) << this << " idling";
                idle();
            }
            continue;
        }
        if (more)
            tickle();

        if (rootThread && task.fiber && task.fiber == m_waitingFiber) {
            {
                boost::mutex::scoped_lock lock(m_mutex);
                --m_running;
            }
            Fiber::yield();
            continue;
        }

        try {
            if (task.fiber) {
                if (task.fiber->state() != Fiber::TERM &&
                    task.fiber->state() != Fiber::EXCEPT)
                    task.fiber->call();
            } else {
                if (dgFiber)
                    dgFiber->reset(task.dg);
                else
                    dgFiber.reset(new Fiber(task.dg));
                dgFiber->call();
                // A Fiber parked on something belongs to whoever wakes it
                if (dgFiber->state() == Fiber::HOLD)
                    dgFiber.reset();
                else
                    dgFiber->reset(boost::function<void ()>());
            }
        } catch (...) {
            CATENA_LOG_FATAL(g_log) << this << " uncaught exception: "
                << boost::current_exception_diagnostic_information();
            boost::mutex::scoped_lock lock(m_mutex);
            --m_running;
            throw;
        }

        bool wake;
        {
            boost::mutex::scoped_lock lock(m_mutex);
            --m_running;
            wake = m_stopping && m_running == 0 && m_queue.empty();
        }
        if (wake)
            tickle();
    }
}

}
