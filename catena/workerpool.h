#ifndef __CATENA_WORKERPOOL_H__
#define __CATENA_WORKERPOOL_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>

#include "scheduler.h"

namespace Catena {

/// Scheduler whose threads simply sleep when there is nothing to do
class WorkerPool : public Scheduler
{
public:
    WorkerPool(size_t threads = 1, bool useCaller = true);
    ~WorkerPool() { stop(); }

protected:
    void idle();
    void tickle();

private:
    boost::mutex m_mutex;
    boost::condition_variable m_condition;
    size_t m_tickles;
};

}

#endif
