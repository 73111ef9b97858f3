// Copyright (c) 2009 - Mozy, Inc.

#include <stdexcept>

#include <boost/bind.hpp>

#include "catena/fiber.h"
#include "catena/fibersynchronization.h"
#include "catena/parallel.h"
#include "catena/test/test.h"
#include "catena/workerpool.h"

using namespace Catena;

static void yieldTwice(int &steps)
{
    ++steps;
    Fiber::yield();
    ++steps;
    Fiber::yield();
    ++steps;
}

CATENA_UNITTEST(Fiber, callAndYield)
{
    int steps = 0;
    Fiber::ptr fiber(new Fiber(boost::bind(&yieldTwice, boost::ref(steps))));
    CATENA_TEST_ASSERT_EQUAL(fiber->state(), Fiber::INIT);
    fiber->call();
    CATENA_TEST_ASSERT_EQUAL(steps, 1);
    CATENA_TEST_ASSERT_EQUAL(fiber->state(), Fiber::HOLD);
    fiber->call();
    CATENA_TEST_ASSERT_EQUAL(steps, 2);
    fiber->call();
    CATENA_TEST_ASSERT_EQUAL(steps, 3);
    CATENA_TEST_ASSERT_EQUAL(fiber->state(), Fiber::TERM);

    fiber->reset(boost::bind(&yieldTwice, boost::ref(steps)));
    CATENA_TEST_ASSERT_EQUAL(fiber->state(), Fiber::INIT);
    fiber->call();
    CATENA_TEST_ASSERT_EQUAL(steps, 4);
    // A Fiber may only be destroyed once it has finished
    fiber->call();
    fiber->call();
    CATENA_TEST_ASSERT_EQUAL(steps, 6);
    CATENA_TEST_ASSERT_EQUAL(fiber->state(), Fiber::TERM);
}

static void throwRuntimeError()
{
    throw std::runtime_error("fiber failed");
}

CATENA_UNITTEST(Fiber, exceptionReachesCaller)
{
    Fiber::ptr fiber(new Fiber(&throwRuntimeError));
    CATENA_TEST_ASSERT_EXCEPTION(fiber->call(), std::runtime_error);
    CATENA_TEST_ASSERT_EQUAL(fiber->state(), Fiber::EXCEPT);
}

static void checkThis(Fiber::ptr &seen)
{
    seen = Fiber::getThis();
}

CATENA_UNITTEST(Fiber, getThis)
{
    Fiber::ptr threadFiber = Fiber::getThis();
    CATENA_TEST_ASSERT(threadFiber);
    Fiber::ptr seen;
    Fiber::ptr fiber(new Fiber(boost::bind(&checkThis, boost::ref(seen))));
    fiber->call();
    CATENA_TEST_ASSERT(seen == fiber);
    CATENA_TEST_ASSERT(Fiber::getThis() == threadFiber);
}

static void record(int value, std::vector<int> &order)
{
    order.push_back(value);
}

CATENA_UNITTEST(ParallelDo, withoutScheduler)
{
    std::vector<int> order;
    std::vector<boost::function<void ()> > dgs;
    for (int i = 0; i < 3; ++i)
        dgs.push_back(boost::bind(&record, i, boost::ref(order)));
    parallel_do(dgs);
    CATENA_TEST_ASSERT_EQUAL(order.size(), 3u);
    CATENA_TEST_ASSERT_EQUAL(order[0], 0);
    CATENA_TEST_ASSERT_EQUAL(order[2], 2);
}

static void yieldThenRecord(int value, std::vector<int> &order)
{
    Scheduler::yield();
    order.push_back(value);
}

CATENA_UNITTEST(ParallelDo, interleavesOnScheduler)
{
    WorkerPool pool;
    std::vector<int> order;
    std::vector<boost::function<void ()> > dgs;
    dgs.push_back(boost::bind(&yieldThenRecord, 0, boost::ref(order)));
    dgs.push_back(boost::bind(&record, 1, boost::ref(order)));
    parallel_do(dgs);
    // The first functor yielded, so the second one overtook it
    CATENA_TEST_ASSERT_EQUAL(order.size(), 2u);
    CATENA_TEST_ASSERT_EQUAL(order[0], 1);
    CATENA_TEST_ASSERT_EQUAL(order[1], 0);
}

static void failWith(const char *message, int &finished)
{
    ++finished;
    throw std::runtime_error(message);
}

CATENA_UNITTEST(ParallelDo, firstExceptionWins)
{
    WorkerPool pool;
    int finished = 0;
    std::vector<boost::function<void ()> > dgs;
    dgs.push_back(boost::bind(&failWith, "first", boost::ref(finished)));
    dgs.push_back(boost::bind(&failWith, "second", boost::ref(finished)));
    try {
        parallel_do(dgs);
        CATENA_TEST_ASSERT(!"parallel_do should have thrown");
    } catch (std::runtime_error &ex) {
        CATENA_TEST_ASSERT_EQUAL(std::string(ex.what()), "first");
    }
    // Both ran to completion before anything was rethrown
    CATENA_TEST_ASSERT_EQUAL(finished, 2);
}

static void limited(int &active, int &peak)
{
    ++active;
    if (active > peak)
        peak = active;
    Scheduler::yield();
    --active;
}

CATENA_UNITTEST(ParallelDo, parallelismLimit)
{
    WorkerPool pool;
    int active = 0, peak = 0;
    std::vector<boost::function<void ()> > dgs;
    for (int i = 0; i < 5; ++i)
        dgs.push_back(boost::bind(&limited, boost::ref(active),
            boost::ref(peak)));
    parallel_do(dgs, 2);
    CATENA_TEST_ASSERT_EQUAL(active, 0);
    CATENA_TEST_ASSERT_EQUAL(peak, 2);
}

static void semaphoreFiber(FiberSemaphore &semaphore, int &passed)
{
    semaphore.wait();
    ++passed;
}

CATENA_UNITTEST(FiberSemaphore, wakesInOrder)
{
    WorkerPool pool;
    FiberSemaphore semaphore(1);
    int passed = 0;
    for (int i = 0; i < 3; ++i)
        pool.schedule(boost::bind(&semaphoreFiber, boost::ref(semaphore),
            boost::ref(passed)));
    pool.dispatch();
    CATENA_TEST_ASSERT_EQUAL(passed, 1);
    semaphore.notify();
    pool.dispatch();
    CATENA_TEST_ASSERT_EQUAL(passed, 2);
    semaphore.notify();
    pool.dispatch();
    CATENA_TEST_ASSERT_EQUAL(passed, 3);
}
