#ifndef __SLUICE_TIMER_H__
#define __SLUICE_TIMER_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <map>
#include <vector>

#include <boost/function.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/mutex.hpp>

namespace Sluice {

class Timer;
class TimerManager;

typedef std::multimap<unsigned long long, boost::shared_ptr<Timer> > TimerQueue;

/// A one-shot callback registered with a TimerManager
class Timer : boost::noncopyable
{
    friend class TimerManager;
public:
    typedef boost::shared_ptr<Timer> ptr;

    /// @return If the timer was still pending
    bool cancel();

private:
    Timer(boost::function<void ()> dg, TimerManager *manager);

    boost::function<void ()> m_dg;
    TimerManager *m_manager;
    TimerQueue::iterator m_position;
};

/// Deadline-ordered set of Timers; the IOManager sleeps until the earliest
class TimerManager : boost::noncopyable
{
    friend class Timer;
public:
    TimerManager() {}
    virtual ~TimerManager();

    /// Call dg once, us microseconds from now
    Timer::ptr registerTimer(unsigned long long us, boost::function<void ()> dg);

    /// @return Microseconds until the earliest timer is due; ~0ull if none
    unsigned long long nextTimer();
    /// Run every callback that is due, on the calling thread
    void executeTimers();

    /// Microseconds on a monotonic clock
    static unsigned long long now();
    /// Replace the clock for every TimerManager; no argument restores it
    static void setClock(boost::function<unsigned long long ()> dg = NULL);

protected:
    /// A timer went in ahead of all the others
    virtual void onTimerInsertedAtFront() {}
    /// Remove the due timers and return their callbacks
    std::vector<boost::function<void ()> > processTimers();

private:
    boost::mutex m_mutex;
    TimerQueue m_timers;
};

}

#endif
