// Copyright (c) 2009 - Mozy, Inc.

#include "workerpool.h"

#include "log.h"

namespace Catena {

static Logger::ptr g_log = Log::lookup("catena:workerpool");

WorkerPool::WorkerPool(size_t threads, bool useCaller)
    : Scheduler(threads, useCaller),
      m_tickles(0)
{
    start();
}

void
WorkerPool::idle()
{
    boost::mutex::scoped_lock lock(m_mutex);
    while (m_tickles == 0)
        m_condition.wait(lock);
    --m_tickles;
}

void
WorkerPool::tickle()
{
    CATENA_LOG_TRACE(g_log) << this << " tickling";
    boost::mutex::scoped_lock lock(m_mutex);
    ++m_tickles;
    m_condition.notify_one();
}

}
