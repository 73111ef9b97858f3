#ifndef __CATENA_THREAD_LOCAL_STORAGE_H__
#define __CATENA_THREAD_LOCAL_STORAGE_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "version.h"

#include <pthread.h>
#include <stdint.h>

#include <boost/noncopyable.hpp>
#include <boost/static_assert.hpp>

#include "exception.h"

namespace Catena {

/// A pointer-sized value with a separate copy per thread, held in a pthread
/// key.  Every thread starts out with a zero value; nothing is destroyed
/// when a thread exits.
template <class T>
class ThreadLocalStorage : boost::noncopyable
{
    BOOST_STATIC_ASSERT(sizeof(T) <= sizeof(void *));
public:
    ThreadLocalStorage()
    {
        int rc = pthread_key_create(&m_key, NULL);
        if (rc)
            CATENA_THROW_EXCEPTION_FROM_ERROR_API(rc, "pthread_key_create");
    }
    ~ThreadLocalStorage() { pthread_key_delete(m_key); }

    T get() const
    { return (T)(intptr_t)pthread_getspecific(m_key); }
    void set(T value)
    {
        int rc = pthread_setspecific(m_key, (const void *)(intptr_t)value);
        if (rc)
            CATENA_THROW_EXCEPTION_FROM_ERROR_API(rc, "pthread_setspecific");
    }

    operator T() const { return get(); }
    T operator =(T value) { set(value); return value; }

private:
    pthread_key_t m_key;
};

}

#endif
