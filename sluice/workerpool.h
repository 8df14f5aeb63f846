#ifndef __SLUICE_WORKERPOOL_H__
#define __SLUICE_WORKERPOOL_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>

#include "scheduler.h"

namespace Sluice {

/// Scheduler for work that never waits on a descriptor
///
/// Idle threads sleep on a condition variable until tickled.  The HTTP and
/// file-serving tests run their in-memory connections on one of these.
class WorkerPool : public Scheduler
{
public:
    WorkerPool(size_t threads = 1, bool useCaller = true)
        : Scheduler(threads, useCaller),
          m_wakeups(0)
    {
        start();
    }
    ~WorkerPool() { stop(); }

protected:
    void idle()
    {
        boost::mutex::scoped_lock lock(m_wakeMutex);
        while (m_wakeups == 0)
            m_wake.wait(lock);
        --m_wakeups;
    }

    void tickle()
    {
        boost::mutex::scoped_lock lock(m_wakeMutex);
        ++m_wakeups;
        m_wake.notify_one();
    }

private:
    boost::mutex m_wakeMutex;
    boost::condition_variable m_wake;
    size_t m_wakeups;
};

}

#endif
