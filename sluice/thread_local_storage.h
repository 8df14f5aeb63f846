#ifndef __SLUICE_THREAD_LOCAL_STORAGE_H__
#define __SLUICE_THREAD_LOCAL_STORAGE_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <pthread.h>

#include <boost/noncopyable.hpp>
#include <boost/static_assert.hpp>

#include "exception.h"

namespace Sluice {

/// A pointer with a separate value on every thread
template <class T>
class ThreadLocalStorage : boost::noncopyable
{
    BOOST_STATIC_ASSERT(sizeof(T) <= sizeof(void *));
public:
    ThreadLocalStorage()
    {
        int rc = pthread_key_create(&m_key, NULL);
        if (rc)
            SLUICE_THROW_EXCEPTION_FROM_ERROR_API(rc, "pthread_key_create");
    }
    ~ThreadLocalStorage() { pthread_key_delete(m_key); }

    T get() const { return (T)pthread_getspecific(m_key); }
    operator T() const { return get(); }
    T operator->() const { return get(); }

    ThreadLocalStorage &operator =(T value)
    {
        int rc = pthread_setspecific(m_key, (const void *)value);
        if (rc)
            SLUICE_THROW_EXCEPTION_FROM_ERROR_API(rc, "pthread_setspecific");
        return *this;
    }

private:
    pthread_key_t m_key;
};

}

#endif
