// Copyright (c) 2009 - Mozy, Inc.

#include "parallel.h"

#include <boost/bind.hpp>
#include <boost/scoped_ptr.hpp>
#include <boost/thread/mutex.hpp>

#include "assert.h"
#include "fiber.h"
#include "fibersynchronization.h"
#include "scheduler.h"

namespace Catena {

static Logger::ptr g_log = Log::lookup("catena:parallel");

namespace {

// Shared by the Fibers of one parallel_do; lives on the caller's stack
struct ParallelState
{
    ParallelState(size_t total, FiberSemaphore *sem)
        : remaining(total),
          sem(sem),
          scheduler(Scheduler::getThis()),
          caller(Fiber::getThis())
    {}

    boost::mutex mutex;
    size_t remaining;
    FiberSemaphore *sem;
    Scheduler *scheduler;
    Fiber::ptr caller;
};

}

static void
runOne(const boost::function<void ()> &dg, boost::exception_ptr &exception)
{
    try {
        dg();
    } catch (boost::exception &ex) {
        removeTopFrames(ex);
        exception = boost::current_exception();
    } catch (...) {
        exception = boost::current_exception();
    }
}

static void
parallelFiber(const boost::function<void ()> &dg,
    boost::exception_ptr &exception, ParallelState &state)
{
    if (state.sem)
        state.sem->wait();
    runOne(dg, exception);
    if (state.sem)
        state.sem->notify();
    bool last;
    {
        boost::mutex::scoped_lock lock(state.mutex);
        last = --state.remaining == 0;
    }
    if (last)
        state.scheduler->schedule(state.caller);
}

void
parallel_do(const std::vector<boost::function<void ()> > &dgs,
    int parallelism)
{
    CATENA_ASSERT(parallelism != 0);
    std::vector<boost::exception_ptr> exceptions(dgs.size());
    Scheduler *scheduler = Scheduler::getThis();
    if (!scheduler || dgs.size() <= 1) {
        CATENA_LOG_TRACE(g_log) << "running " << dgs.size()
            << " functors in sequence";
        for (size_t i = 0; i < dgs.size(); ++i)
            runOne(dgs[i], exceptions[i]);
    } else {
        CATENA_LOG_TRACE(g_log) << "running " << dgs.size()
            << " functors on " << scheduler;
        boost::scoped_ptr<FiberSemaphore> sem;
        if (parallelism > 0)
            sem.reset(new FiberSemaphore(parallelism));
        ParallelState state(dgs.size(), sem.get());
        std::vector<Fiber::ptr> fibers;
        fibers.reserve(dgs.size());
        for (size_t i = 0; i < dgs.size(); ++i) {
            fibers.push_back(Fiber::ptr(new Fiber(boost::bind(&parallelFiber,
                boost::cref(dgs[i]), boost::ref(exceptions[i]),
                boost::ref(state)))));
            scheduler->schedule(fibers.back());
        }
        // The last Fiber to finish schedules us again
        Scheduler::yieldTo();
    }
    for (size_t i = 0; i < exceptions.size(); ++i) {
        if (exceptions[i])
            Catena::rethrow_exception(exceptions[i]);
    }
}

}
